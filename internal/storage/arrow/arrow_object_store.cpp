#include "arrow_object_store.hpp"

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/io/memory.h>
#include <arrow/result.h>
#include <arrow/util/future.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/fingerprint.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace migrator::storage {

using namespace migrator::storage::common;

namespace {

using migrator::observability::StringField;

constexpr int64_t kHashChunkBytes = 1 << 20;

// Suffix of the temporary file a local upload is written to before the rename.
constexpr const char* kPartialSuffix = ".migrating";

arrow::fs::FileSelector RecursiveSelector(const std::string& root) {
  arrow::fs::FileSelector selector;
  selector.base_dir        = root;
  selector.recursive       = true;
  selector.allow_not_found = false;
  return selector;
}

std::string ParentOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

/*
  Folders with nothing below them.

  Arrow reports "<prefix>/" marker objects as directories. A prefix that only
  exists because objects live under it is never empty, so the empty ones are
  exactly the markers (or empty folders on a local disk).
*/
class EmptyDirectories {
 public:
  void Observe(const arrow::fs::FileInfo& info) {
    non_empty_.insert(ParentOf(info.path()));
    if (info.IsDirectory()) directories_.push_back(info.path());
  }

  std::vector<std::string> Collect() const {
    std::vector<std::string> empty;
    for (const auto& directory : directories_) {
      if (non_empty_.count(directory) == 0) empty.push_back(directory);
    }
    return empty;
  }

 private:
  std::unordered_set<std::string> non_empty_;
  std::vector<std::string>        directories_;
};

/*
  Content fingerprint the store reports without reading the object body.

    content-md5 user metadata  → that digest
    plain ETag                 → the ETag
    multipart ETag             → reported, but not comparable (nullopt)
    neither                    → not reported; the caller hashes the bytes
*/
struct ReportedFingerprint {
  bool                       reported = false;
  std::optional<std::string> value;
};

ReportedFingerprint FingerprintFromMetadata(const arrow::KeyValueMetadata* metadata) {
  ReportedFingerprint result;
  if (!metadata) return result;

  const int md5_index = metadata->FindKey(kContentMd5MetadataKey);
  if (md5_index >= 0) {
    if (auto md5 = NormalizeEtag(metadata->value(md5_index))) {
      result.reported = true;
      result.value    = std::move(md5);
      return result;
    }
  }

  const int etag_index = metadata->FindKey("ETag");
  if (etag_index >= 0) {
    result.reported = true;
    result.value    = NormalizeEtag(metadata->value(etag_index));
  }
  return result;
}

/*
  Pages through the filesystem's async listing one batch at a time.

  Objects are emitted as their batch arrives. Empty folders are only known
  once the whole listing has been seen, so their marker keys come last.
*/
class ArrowObjectListing final : public ObjectListing {
 public:
  ArrowObjectListing(arrow::fs::FileInfoGenerator generator, std::string root)
      : generator_(std::move(generator)), root_(std::move(root)) {
  }

  std::optional<model::SourceObjectRef> Next() override {
    while (pending_.empty()) {
      if (exhausted_) return std::nullopt;

      auto batch = Unwrap(generator_().result(), "list " + root_);
      if (batch.empty()) {
        exhausted_ = true;
        for (const auto& directory : directories_.Collect()) {
          model::SourceObjectRef marker;
          marker.key        = RelativeKey(directory) + "/";
          marker.size_bytes = 0;
          pending_.push_back(std::move(marker));
        }
        continue;
      }
      for (const auto& info : batch) {
        directories_.Observe(info);
        if (!info.IsFile()) continue;

        model::SourceObjectRef ref;
        ref.key        = RelativeKey(info.path());
        ref.size_bytes = info.size() > 0 ? static_cast<uint64_t>(info.size()) : 0;
        pending_.push_back(std::move(ref));
      }
    }

    auto ref = std::move(pending_.front());
    pending_.pop_front();
    return ref;
  }

 private:
  std::string RelativeKey(const std::string& path) const {
    if (root_.empty()) return path;
    const auto prefix = root_.back() == '/' ? root_ : root_ + "/";
    if (path.rfind(prefix, 0) == 0) return path.substr(prefix.size());
    return path;
  }

  arrow::fs::FileInfoGenerator       generator_;
  std::string                        root_;
  std::deque<model::SourceObjectRef> pending_;
  EmptyDirectories                   directories_;
  bool                               exhausted_ = false;
};

} // namespace

// ------------------------------------------------------------------
// Source
// ------------------------------------------------------------------

ArrowObjectSource::ArrowObjectSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root)
    : fs_(std::move(fs)), root_(std::move(root)) {
}

std::unique_ptr<ObjectListing> ArrowObjectSource::List() {
  return std::make_unique<ArrowObjectListing>(fs_->GetFileInfoGenerator(RecursiveSelector(root_)), root_);
}

/*
  Open object for streaming download
*/
std::shared_ptr<arrow::io::InputStream> ArrowObjectSource::Fetch(const std::string& key) {
  ValidateObjectKey(key);
  const auto path = JoinObjectPath(root_, key);
  if (IsDirectoryMarker(key)) {
    auto info = Unwrap(fs_->GetFileInfo(MarkerDirectory(path)), "fetch " + key);
    if (!info.IsDirectory()) throw util::TransientIOError("folder marker vanished from source: " + key);
    return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(""));
  }
  return Unwrap(fs_->OpenInputStream(path), "fetch " + key);
}

std::string ArrowObjectSource::Describe() const {
  return fs_->type_name() + ":" + root_;
}

// ------------------------------------------------------------------
// Destination
// ------------------------------------------------------------------

ArrowObjectSink::ArrowObjectSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root)
    : fs_(std::move(fs)), root_(std::move(root)), local_(fs_->type_name() == "local") {
}

std::string ArrowObjectSink::ObjectPath(const std::string& key) const {
  ValidateObjectKey(key);
  return JoinObjectPath(root_, key);
}

bool ArrowObjectSink::BucketExists() {
  auto info = Unwrap(fs_->GetFileInfo(root_), "head bucket " + root_);
  return info.IsDirectory();
}

/*
  Opened by path so object stores issue their HEAD request and expose the
  ETag and user metadata. Only stores that report neither (local disk) are
  hashed in full.
*/
std::optional<ObjectHead> ArrowObjectSink::Head(const std::string& key) {
  const auto path = ObjectPath(key);

  if (IsDirectoryMarker(key)) {
    auto info = Unwrap(fs_->GetFileInfo(MarkerDirectory(path)), "head " + key);
    if (!info.IsDirectory()) return std::nullopt;
    ObjectHead head;
    head.fingerprint = std::string(kEmptyContentFingerprint);
    return head;
  }

  auto info = Unwrap(fs_->GetFileInfo(path), "head " + key);
  if (info.type() == arrow::fs::FileType::NotFound) {
    return std::nullopt;
  }
  if (!info.IsFile()) {
    throw util::InvalidInput("destination key is not an object: " + key);
  }

  ObjectHead head;
  head.size_bytes = info.size() > 0 ? static_cast<uint64_t>(info.size()) : 0;

  auto input    = Unwrap(fs_->OpenInputStream(path), "open " + key);
  auto metadata = Unwrap(input->ReadMetadata(), "read metadata " + key);

  auto reported = FingerprintFromMetadata(metadata.get());
  if (reported.reported) {
    head.fingerprint = std::move(reported.value);
  } else {
    head.fingerprint = Md5Hex(*input, kHashChunkBytes);
  }

  ThrowIfError(input->Close(), "close " + key);
  return head;
}

/*
  Upload buffer as object, chunk by chunk so the caller can throttle.

  A failed upload never replaces the previous object: object stores abort
  the pending upload, local files are written beside the target and only
  renamed over it once complete.
*/
void ArrowObjectSink::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata,
                          int64_t chunk_bytes, const PushThrottle& throttle) {
  const auto path = ObjectPath(key);

  if (IsDirectoryMarker(key)) {
    if (data->size() != 0) throw util::InvalidInput("folder marker must be empty: " + key);
    ThrowIfError(fs_->CreateDir(MarkerDirectory(path), /*recursive=*/true), "put " + key);
    return;
  }

  // local filesystems need the parent hierarchy; object stores create it implicitly
  if (local_) {
    const auto slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
      ThrowIfError(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true), "create parent of " + key);
    }
  }

  const auto write_path = local_ ? path + kPartialSuffix : path;
  auto       out        = Unwrap(fs_->OpenOutputStream(write_path, ToKeyValueMetadata(metadata)), "put " + key);

  try {
    const int64_t size  = data->size();
    const int64_t chunk = std::max<int64_t>(chunk_bytes, 1);
    for (int64_t offset = 0; offset < size; offset += chunk) {
      const int64_t length = std::min(chunk, size - offset);
      if (throttle) throttle(length);
      ThrowIfError(out->Write(data->data() + offset, length), "put " + key);
    }
    ThrowIfError(out->Close(), "put " + key);
  } catch (const std::exception&) {
    DiscardUpload(*out, write_path, key);
    throw;
  }

  if (local_) {
    ThrowIfError(fs_->Move(write_path, path), "put " + key);
  }
}

void ArrowObjectSink::DiscardUpload(arrow::io::OutputStream& out, const std::string& write_path, const std::string& key) {
  const auto aborted = out.Abort();
  if (!aborted.ok()) {
    MIGRATOR_LOG_WARN("Failed to abort upload", {StringField("key", key), StringField("error", aborted.ToString())});
  }
  if (!local_) return;

  const auto removed = fs_->DeleteFile(write_path);
  if (!removed.ok()) {
    MIGRATOR_LOG_WARN("Failed to remove partial upload", {StringField("path", write_path), StringField("error", removed.ToString())});
  }
}

// Objects plus folder markers, matching what the source listing emits.
uint64_t ArrowObjectSink::Count() {
  auto             infos = Unwrap(fs_->GetFileInfo(RecursiveSelector(root_)), "count " + root_);
  uint64_t         count = 0;
  EmptyDirectories directories;
  for (const auto& info : infos) {
    directories.Observe(info);
    if (info.IsFile()) ++count;
  }
  return count + directories.Collect().size();
}

std::string ArrowObjectSink::Describe() const {
  return fs_->type_name() + ":" + root_;
}

} // namespace migrator::storage
