#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <filesystem>
#include <memory>
#include <string>

namespace migrator::transfer {

/*
  A fetched object held locally for the duration of one task.

  Owns its staging file (if any) and deletes it on destruction, whatever
  path the task took. Move-only.
*/
class StagedObject {
 public:
  StagedObject(std::filesystem::path path, std::shared_ptr<arrow::Buffer> data);
  ~StagedObject();

  StagedObject(const StagedObject&)            = delete;
  StagedObject& operator=(const StagedObject&) = delete;

  StagedObject(StagedObject&& other) noexcept;
  StagedObject& operator=(StagedObject&& other) noexcept;

  const std::shared_ptr<arrow::Buffer>& data() const {
    return data_;
  }
  const std::filesystem::path& path() const {
    return path_;
  }
  int64_t size() const {
    return data_ ? data_->size() : 0;
  }

  // drop the bytes and remove the staging file now
  void Release() noexcept;

 private:
  std::filesystem::path          path_;
  std::shared_ptr<arrow::Buffer> data_;
};

/*
  Local staging directory shared by all workers.

  Each run stages below its own subdirectory of the configured root:

      <root>/run-<timestamp>-<random>/<md5(key)>.part

  so Cleanup() only ever removes what this run created, and concurrent runs
  sharing a root never see each other's files. Disk staged bytes are
  memory-mapped rather than copied onto the heap. In-memory mode skips the
  disk entirely.
*/
class StagingArea {
 public:
  StagingArea(std::filesystem::path root, bool in_memory, int64_t chunk_bytes);

  void Prepare();
  void Cleanup();

  std::filesystem::path PathFor(const std::string& key) const;

  // Throws the input stream's classified error on failure; a partial file is removed.
  StagedObject Stage(const std::string& key, arrow::io::InputStream& input) const;

  const std::filesystem::path& root() const {
    return root_;
  }
  const std::filesystem::path& run_directory() const {
    return run_dir_;
  }
  bool in_memory() const {
    return in_memory_;
  }

 private:
  std::filesystem::path root_;
  std::filesystem::path run_dir_;
  bool                  created_root_ = false;
  bool                  in_memory_;
  int64_t               chunk_bytes_;
};

} // namespace migrator::transfer
