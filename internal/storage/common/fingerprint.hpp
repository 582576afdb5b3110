#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace migrator::storage::common {

/*
  Content fingerprints are lowercase hex MD5 digests, the same value S3 and
  Swift report as ETag / hash for single-part uploads.
*/

inline constexpr std::string_view kEmptyContentFingerprint = "d41d8cd98f00b204e9800998ecf8427e";

// User metadata carrying the content MD5 for uploads whose ETag is not one
// (multipart). Written on every push, read back by Head.
inline constexpr const char* kContentMd5MetadataKey = "x-amz-meta-content-md5";

class Md5Hasher {
 public:
  Md5Hasher();

  void Update(const uint8_t* data, std::size_t size);

  // Finalizes the digest; the hasher must not be updated afterwards.
  std::string HexDigest();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      EVP_MD_CTX_free(ctx);
    }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

// All three throw util::ChecksumComputationError on failure.
std::string Md5Hex(const arrow::Buffer& buffer);
std::string Md5Hex(std::string_view data);
std::string Md5Hex(arrow::io::InputStream& input, int64_t chunk_bytes);

/*
  Normalise an ETag to a comparable fingerprint.

  Strips quotes and lowercases. Returns nullopt for multipart ETags
  ("<md5>-<parts>") and anything else that is not a plain MD5.
*/
std::optional<std::string> NormalizeEtag(std::string_view etag);

} // namespace migrator::storage::common
