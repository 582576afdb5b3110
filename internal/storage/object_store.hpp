#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/transfer_task.hpp"

namespace migrator::storage {

/*
  Object store abstraction.

  The engine never speaks a store protocol directly; it only needs
  List/Fetch on the source side and Exists/Head/Put/Count on the
  destination side.

  Implementations:
    ARROW    → any Arrow filesystem (S3, Swift S3 API, GCS, Azure, local)
    MEMORY   → in-process map (tests/unit/testing)
*/

// ------------------------------------------------------------------
// Listing
// ------------------------------------------------------------------
/*
  Forward-only cursor over a container.

  Finite and not restartable: once Next() returned nullopt the listing is
  exhausted. Backends page lazily where they can.
*/
class ObjectListing {
 public:
  virtual ~ObjectListing() = default;

  virtual std::optional<model::SourceObjectRef> Next() = 0;
};

class ObjectSource {
 public:
  virtual ~ObjectSource() = default;

  virtual std::unique_ptr<ObjectListing> List() = 0;

  /*
    Open the object's bytes for streaming.

    Throws util::TransientIOError / AuthExpired / InvalidInput.
  */
  virtual std::shared_ptr<arrow::io::InputStream> Fetch(const std::string& key) = 0;

  virtual std::string Describe() const = 0;
};

// ------------------------------------------------------------------
// Destination
// ------------------------------------------------------------------

struct ObjectHead {
  uint64_t size_bytes = 0;

  // normalised content fingerprint, nullopt when the store cannot provide a
  // comparable one (e.g. multipart ETag)
  std::optional<std::string> fingerprint;
};

using ObjectMetadata = std::map<std::string, std::string>;

// Called with each chunk size before the chunk is written.
using PushThrottle = std::function<void(int64_t)>;

class ObjectSink {
 public:
  virtual ~ObjectSink() = default;

  virtual bool BucketExists() = 0;

  /*
    nullopt means the key does not exist.
    Real lookup failures throw.
  */
  virtual std::optional<ObjectHead> Head(const std::string& key) = 0;

  /*
    Write the object in chunks of at most chunk_bytes, calling throttle
    before every chunk. Replaces an existing object under the same key.
  */
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata, int64_t chunk_bytes,
                   const PushThrottle& throttle) = 0;

  virtual uint64_t Count() = 0;

  virtual std::string Describe() const = 0;
};

using ObjectSourcePtr = std::shared_ptr<ObjectSource>;
using ObjectSinkPtr   = std::shared_ptr<ObjectSink>;

} // namespace migrator::storage
