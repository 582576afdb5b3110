#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/io/memory.h>

#include <array>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace migrator::storage::common {

namespace {

// Substrings the AWS SDK (and S3 compatible gateways) put into error text.
constexpr std::array<std::string_view, 7> kAuthMarkers = {
    "ExpiredToken", "TokenRefreshRequired", "InvalidAccessKeyId", "InvalidToken", "SignatureDoesNotMatch", "ACCESS_DENIED", "AccessDenied",
};

constexpr std::array<std::string_view, 3> kMissingBucketMarkers = {
    "NoSuchBucket",
    "NO_SUCH_BUCKET",
    "Bucket does not exist",
};

template <std::size_t N>
bool ContainsAny(const std::string& text, const std::array<std::string_view, N>& markers) {
  for (const auto marker : markers) {
    if (text.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool IsLocalUri(const std::string& uri) {
  return uri.empty() || uri.front() == '/' || uri.rfind("file://", 0) == 0;
}

} // namespace

void ThrowStatus(const arrow::Status& status, const std::string& context) {
  const auto message = context + ": " + status.ToString();

  if (ContainsAny(message, kAuthMarkers)) {
    throw util::AuthExpired(message);
  }
  if (ContainsAny(message, kMissingBucketMarkers)) {
    throw util::DestinationMissing(message);
  }
  if (status.IsInvalid() || status.IsTypeError()) {
    throw util::InvalidInput(message);
  }
  throw util::TransientIOError(message);
}

std::shared_ptr<arrow::Buffer> ReadAll(arrow::io::InputStream& input, int64_t chunk_bytes, const std::string& context) {
  auto sink = Unwrap(arrow::io::BufferOutputStream::Create(), context);

  while (true) {
    auto chunk = Unwrap(input.Read(chunk_bytes), context);
    if (chunk->size() == 0) break;
    ThrowIfError(sink->Write(chunk), context);
  }

  return Unwrap(sink->Finish(), context);
}

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const std::map<std::string, std::string>& metadata) {
  std::vector<std::string> keys;
  std::vector<std::string> values;
  keys.reserve(metadata.size());
  values.reserve(metadata.size());
  for (const auto& [key, value] : metadata) {
    keys.push_back(key);
    values.push_back(value);
  }
  if (keys.empty()) {
    return {};
  }
  return std::static_pointer_cast<const arrow::KeyValueMetadata>(arrow::KeyValueMetadata::Make(std::move(keys), std::move(values)));
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const migrator::runtime::config::StoreConfig& store, const std::string& region_override) {
  using migrator::runtime::config::FileSystemKind;

  const auto& uri  = store.uri();
  auto        kind = store.filesystem();
  if (kind == FileSystemKind::FILE_SYSTEM_AUTO) {
    if (uri.rfind("s3://", 0) == 0) {
      kind = FileSystemKind::FILE_SYSTEM_S3;
    } else if (IsLocalUri(uri)) {
      kind = FileSystemKind::FILE_SYSTEM_LOCAL;
    }
  }

  std::string resolved_path;

  switch (kind) {
    case FileSystemKind::FILE_SYSTEM_LOCAL: {
      if (uri.rfind("file://", 0) == 0) {
        ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(uri, &resolved_path));
        return std::make_pair(std::move(fs), resolved_path);
      }
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), uri);
    }

    case FileSystemKind::FILE_SYSTEM_S3: {
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

      arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();
      if (!uri.empty() && uri != "s3://") {
        ARROW_ASSIGN_OR_RAISE(options, arrow::fs::S3Options::FromUri(uri, &resolved_path));
      }

      const auto& proto_options = store.s3();
      if (!proto_options.region().empty()) options.region = proto_options.region();
      if (!region_override.empty()) options.region = region_override;
      if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
      if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
      if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
      if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();
      options.force_virtual_addressing = proto_options.force_virtual_addressing();
      if (!proto_options.access_key().empty()) {
        options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key(), proto_options.session_token());
      } else if (proto_options.anonymous()) {
        options.ConfigureAnonymousCredentials();
      }

      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }

    case FileSystemKind::FILE_SYSTEM_GCS:
    case FileSystemKind::FILE_SYSTEM_AZURE: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(uri, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case FileSystemKind::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

void FinalizeFileSystems() {
  if (arrow::fs::IsS3Initialized()) {
    auto status = arrow::fs::FinalizeS3();
    if (!status.ok()) {
      throw std::runtime_error("S3 finalize failed: " + status.ToString());
    }
  }
}

} // namespace migrator::storage::common
