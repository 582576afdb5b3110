#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <memory>
#include <optional>
#include <string>

#include "internal/storage/object_store.hpp"

namespace migrator::storage {

/*
  Container backed by an Arrow filesystem (S3 / Swift S3 API / GCS / local).

  Object path layout:

      <root>/<key>

  where <root> is "<uri path>/<container or bucket>". Keys ending in '/' are
  folder markers and map to (empty) directories.
*/

class ArrowObjectSource final : public ObjectSource {
 public:
  ArrowObjectSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

  std::unique_ptr<ObjectListing> List() override;

  std::shared_ptr<arrow::io::InputStream> Fetch(const std::string& key) override;

  std::string Describe() const override;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
};

class ArrowObjectSink final : public ObjectSink {
 public:
  ArrowObjectSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

  bool BucketExists() override;

  std::optional<ObjectHead> Head(const std::string& key) override;

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata, int64_t chunk_bytes,
           const PushThrottle& throttle) override;

  uint64_t Count() override;

  std::string Describe() const override;

 private:
  std::string ObjectPath(const std::string& key) const;
  void        DiscardUpload(arrow::io::OutputStream& out, const std::string& write_path, const std::string& key);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
  bool                                   local_;
};

} // namespace migrator::storage
