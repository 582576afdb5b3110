#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/key_value_metadata.h>

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace migrator::storage::common {

/*
  Map a failed Arrow status onto the migrator error taxonomy and throw.

    expired / rejected credentials  → util::AuthExpired
    missing bucket                  → util::DestinationMissing
    Status::Invalid                 → util::InvalidInput
    everything else                 → util::TransientIOError
*/
[[noreturn]] void ThrowStatus(const arrow::Status& status, const std::string& context);

inline void ThrowIfError(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) ThrowStatus(status, context);
}

/*
  Helper: unwrap Arrow Result<T> or throw a classified error
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) ThrowStatus(result.status(), context);
  return std::move(result).ValueOrDie();
}

/*
  Drain a stream into a single buffer, chunk by chunk.
*/
std::shared_ptr<arrow::Buffer> ReadAll(arrow::io::InputStream& input, int64_t chunk_bytes, const std::string& context);

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const std::map<std::string, std::string>& metadata);

/*
  Resolve a configured store into (filesystem, root path).

  The root path is the store URI's path component; the container or bucket
  name is appended by the caller.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const migrator::runtime::config::StoreConfig& store, const std::string& region_override);

// Release process-wide S3 state. Safe to call when S3 was never used.
void FinalizeFileSystems();

} // namespace migrator::storage::common
