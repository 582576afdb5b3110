#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/storage/object_store.hpp"

namespace migrator::storage {

/*
  In-memory container.

  Serves as both a source and a destination so a test can migrate from one
  instance into another without any network. Listings advertise the MD5 of
  each object the way a Swift container listing does.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryObjectStore final : public ObjectSource, public ObjectSink {
 public:
  explicit MemoryObjectStore(std::string name, bool bucket_exists = true);
  ~MemoryObjectStore() override = default;

  // seeding / inspection helpers
  void                           PutObject(const std::string& key, std::string content);
  std::shared_ptr<arrow::Buffer> GetObject(const std::string& key) const;
  bool                           Contains(const std::string& key) const;
  ObjectMetadata                 MetadataOf(const std::string& key) const;
  void                           SetBucketExists(bool exists);

  // ObjectSource interface
  std::unique_ptr<ObjectListing>          List() override;
  std::shared_ptr<arrow::io::InputStream> Fetch(const std::string& key) override;

  // ObjectSink interface
  bool                      BucketExists() override;
  std::optional<ObjectHead> Head(const std::string& key) override;
  void     Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata, int64_t chunk_bytes,
               const PushThrottle& throttle) override;
  uint64_t Count() override;

  std::string Describe() const override;

  uint64_t fetch_count() const {
    return fetch_count_.load();
  }
  uint64_t head_count() const {
    return head_count_.load();
  }
  uint64_t put_count() const {
    return put_count_.load();
  }
  uint64_t bytes_written() const {
    return bytes_written_.load();
  }

 private:
  struct Entry {
    std::shared_ptr<arrow::Buffer> data;
    std::string                    md5;
    ObjectMetadata                 metadata;
  };

  void Store(const std::string& key, std::shared_ptr<arrow::Buffer> data, ObjectMetadata metadata);

  const std::string name_;

  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> objects_;
  bool                         bucket_exists_;

  std::atomic<uint64_t> fetch_count_{0};
  std::atomic<uint64_t> head_count_{0};
  std::atomic<uint64_t> put_count_{0};
  std::atomic<uint64_t> bytes_written_{0};
};

} // namespace migrator::storage
