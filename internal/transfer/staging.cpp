#include "staging.hpp"

#include <arrow/io/file.h>
#include <arrow/io/memory.h>

#include <cstdio>
#include <random>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/fingerprint.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/time.hpp"

namespace migrator::transfer {

using migrator::observability::IntField;
using migrator::observability::StringField;
using namespace migrator::storage::common;

namespace {

// Removes a partially written staging file unless disarmed.
struct RemoveOnFailure {
  const std::filesystem::path& path;
  bool                         armed = true;

  ~RemoveOnFailure() {
    if (armed) {
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  }
};

std::string RunDirectoryName() {
  std::random_device                      device;
  std::uniform_int_distribution<uint32_t> dist;
  char                                    suffix[9];
  std::snprintf(suffix, sizeof(suffix), "%08x", dist(device));
  return "run-" + util::FormatFileTimestamp(util::Now()) + "-" + suffix;
}

} // namespace

// ------------------------------------------------------------------
// StagedObject
// ------------------------------------------------------------------

StagedObject::StagedObject(std::filesystem::path path, std::shared_ptr<arrow::Buffer> data)
    : path_(std::move(path)), data_(std::move(data)) {
}

StagedObject::~StagedObject() {
  Release();
}

StagedObject::StagedObject(StagedObject&& other) noexcept : path_(std::move(other.path_)), data_(std::move(other.data_)) {
  other.path_.clear();
}

StagedObject& StagedObject::operator=(StagedObject&& other) noexcept {
  if (this != &other) {
    Release();
    path_ = std::move(other.path_);
    data_ = std::move(other.data_);
    other.path_.clear();
  }
  return *this;
}

void StagedObject::Release() noexcept {
  data_.reset();
  if (!path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
  }
}

// ------------------------------------------------------------------
// StagingArea
// ------------------------------------------------------------------

StagingArea::StagingArea(std::filesystem::path root, bool in_memory, int64_t chunk_bytes)
    : root_(std::move(root)),
      run_dir_(root_ / RunDirectoryName()),
      in_memory_(in_memory),
      chunk_bytes_(chunk_bytes > 0 ? chunk_bytes : 1 << 20) {
}

void StagingArea::Prepare() {
  if (in_memory_) return;
  created_root_ = !std::filesystem::exists(root_);
  std::filesystem::create_directories(run_dir_);
  MIGRATOR_LOG_DEBUG("Staging directory ready", {StringField("path", run_dir_.string())});
}

/*
  Removes this run's subdirectory, then the root only if Prepare() created
  it and nothing else has been put there since.
*/
void StagingArea::Cleanup() {
  if (in_memory_) return;

  std::error_code ec;
  if (!std::filesystem::exists(run_dir_, ec)) return;

  const auto removed = std::filesystem::remove_all(run_dir_, ec);
  if (ec) {
    MIGRATOR_LOG_WARN("Failed to remove staging directory", {StringField("path", run_dir_.string()), StringField("error", ec.message())});
    return;
  }
  if (created_root_ && std::filesystem::is_empty(root_, ec)) {
    std::filesystem::remove(root_, ec);
  }
  MIGRATOR_LOG_INFO("Temporary files have been removed", {StringField("path", run_dir_.string()), IntField("entries", removed)});
}

/*
  Staging files are flat, named after the key's digest: object stores allow
  both "a" and "a/b" as keys, which cannot coexist as a mirrored tree.
*/
std::filesystem::path StagingArea::PathFor(const std::string& key) const {
  ValidateObjectKey(key);
  return run_dir_ / (Md5Hex(key) + ".part");
}

StagedObject StagingArea::Stage(const std::string& key, arrow::io::InputStream& input) const {
  if (in_memory_) {
    return StagedObject({}, ReadAll(input, chunk_bytes_, "stage " + key));
  }

  const auto      path = PathFor(key);
  RemoveOnFailure guard{path};

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()), "stage " + key);
    while (true) {
      auto chunk = Unwrap(input.Read(chunk_bytes_), "stage " + key);
      if (chunk->size() == 0) break;
      ThrowIfError(out->Write(chunk), "stage " + key);
    }
    ThrowIfError(out->Close(), "stage " + key);
  }

  // The mapping outlives the file handle; the buffer keeps it alive.
  auto file = Unwrap(arrow::io::MemoryMappedFile::Open(path.string(), arrow::io::FileMode::READ), "stage " + key);
  auto size = Unwrap(file->GetSize(), "stage " + key);
  auto data = Unwrap(file->ReadAt(0, size), "stage " + key);
  ThrowIfError(file->Close(), "stage " + key);

  guard.armed = false;
  return StagedObject(path, std::move(data));
}

} // namespace migrator::transfer
