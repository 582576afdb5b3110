#include "fingerprint.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace migrator::storage::common {

namespace {

std::string ToHex(const unsigned char* digest, unsigned int size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    result.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    result.push_back(kHex[digest[i] & 0x0F]);
  }
  return result;
}

} // namespace

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw util::ChecksumComputationError("md5: failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    throw util::ChecksumComputationError("md5: digest init failed");
  }
}

void Md5Hasher::Update(const uint8_t* data, std::size_t size) {
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw util::ChecksumComputationError("md5: digest update failed");
  }
}

std::string Md5Hasher::HexDigest() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  size = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &size) != 1) {
    throw util::ChecksumComputationError("md5: digest final failed");
  }
  return ToHex(digest, size);
}

std::string Md5Hex(const arrow::Buffer& buffer) {
  Md5Hasher hasher;
  hasher.Update(buffer.data(), static_cast<std::size_t>(buffer.size()));
  return hasher.HexDigest();
}

std::string Md5Hex(std::string_view data) {
  Md5Hasher hasher;
  hasher.Update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  return hasher.HexDigest();
}

std::string Md5Hex(arrow::io::InputStream& input, int64_t chunk_bytes) {
  Md5Hasher hasher;
  while (true) {
    auto chunk = input.Read(chunk_bytes);
    if (!chunk.ok()) {
      throw util::ChecksumComputationError("md5: read failed: " + chunk.status().ToString());
    }
    const auto& buffer = *chunk;
    if (buffer->size() == 0) break;
    hasher.Update(buffer->data(), static_cast<std::size_t>(buffer->size()));
  }
  return hasher.HexDigest();
}

std::optional<std::string> NormalizeEtag(std::string_view etag) {
  while (!etag.empty() && (etag.front() == '"' || etag.front() == ' ')) etag.remove_prefix(1);
  while (!etag.empty() && (etag.back() == '"' || etag.back() == ' ')) etag.remove_suffix(1);

  if (etag.size() != 32) {
    return std::nullopt;
  }

  std::string normalized;
  normalized.reserve(etag.size());
  for (char c : etag) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return normalized;
}

} // namespace migrator::storage::common
