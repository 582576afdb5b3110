#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/execution_context.hpp"
#include "internal/util/errors.hpp"
#include "testing/memory_object_store.hpp"

namespace migrator::testing {

// ------------------------------------------------------------------
// Temp directory
// ------------------------------------------------------------------

class TempDir {
 public:
  explicit TempDir(const std::string& name) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / ("object_migrator_" + name + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline std::size_t CountEntries(const std::filesystem::path& dir) {
  if (!std::filesystem::exists(dir)) return 0;
  return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir), std::filesystem::directory_iterator{}));
}

// ------------------------------------------------------------------
// Fault injection
// ------------------------------------------------------------------

using KeyHook = std::function<void(const std::string& key)>;

/*
  Destination wrapper whose hooks run before the real call and may throw.
*/
class FaultySink final : public storage::ObjectSink {
 public:
  explicit FaultySink(std::shared_ptr<storage::MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  void SetPutHook(KeyHook hook) {
    put_hook_ = std::move(hook);
  }
  void SetHeadHook(KeyHook hook) {
    head_hook_ = std::move(hook);
  }
  void SetCountHook(std::function<void()> hook) {
    count_hook_ = std::move(hook);
  }

  bool BucketExists() override {
    return inner_->BucketExists();
  }

  std::optional<storage::ObjectHead> Head(const std::string& key) override {
    if (head_hook_) head_hook_(key);
    return inner_->Head(key);
  }

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const storage::ObjectMetadata& metadata, int64_t chunk_bytes,
           const storage::PushThrottle& throttle) override {
    put_calls_++;
    if (put_hook_) put_hook_(key);
    inner_->Put(key, data, metadata, chunk_bytes, throttle);
  }

  uint64_t Count() override {
    if (count_hook_) count_hook_();
    return inner_->Count();
  }

  std::string Describe() const override {
    return "faulty(" + inner_->Describe() + ")";
  }

  uint64_t put_calls() const {
    return put_calls_.load();
  }

 private:
  std::shared_ptr<storage::MemoryObjectStore> inner_;
  KeyHook                                     put_hook_;
  KeyHook                                     head_hook_;
  std::function<void()>                       count_hook_;
  std::atomic<uint64_t>                       put_calls_{0};
};

class FaultySource final : public storage::ObjectSource {
 public:
  explicit FaultySource(std::shared_ptr<storage::MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  void SetFetchHook(KeyHook hook) {
    fetch_hook_ = std::move(hook);
  }

  std::unique_ptr<storage::ObjectListing> List() override {
    return inner_->List();
  }

  std::shared_ptr<arrow::io::InputStream> Fetch(const std::string& key) override {
    fetch_calls_++;
    if (fetch_hook_) fetch_hook_(key);
    return inner_->Fetch(key);
  }

  std::string Describe() const override {
    return "faulty(" + inner_->Describe() + ")";
  }

  uint64_t fetch_calls() const {
    return fetch_calls_.load();
  }

 private:
  std::shared_ptr<storage::MemoryObjectStore> inner_;
  KeyHook                                     fetch_hook_;
  std::atomic<uint64_t>                       fetch_calls_{0};
};

// Throws T for the first `times` calls (always when times < 0).
template <typename T>
KeyHook FailTimes(int times, std::string message = "injected failure") {
  auto       remaining = std::make_shared<std::atomic<int>>(times);
  const bool always    = times < 0;
  return [remaining, always, message](const std::string& key) {
    if (always || remaining->fetch_sub(1) > 0) {
      throw T(message + ": " + key);
    }
  };
}

/*
  Stream that yields `good_bytes` bytes and then fails with an IOError.
*/
class FailingInputStream final : public arrow::io::InputStream {
 public:
  explicit FailingInputStream(int64_t good_bytes) : good_bytes_(good_bytes) {
  }

  arrow::Status Close() override {
    closed_ = true;
    return arrow::Status::OK();
  }

  bool closed() const override {
    return closed_;
  }

  arrow::Result<int64_t> Tell() const override {
    return position_;
  }

  arrow::Result<int64_t> Read(int64_t nbytes, void* out) override {
    ARROW_ASSIGN_OR_RAISE(auto buffer, Read(nbytes));
    std::copy(buffer->data(), buffer->data() + buffer->size(), static_cast<uint8_t*>(out));
    return buffer->size();
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override {
    if (position_ >= good_bytes_) {
      return arrow::Status::IOError("connection reset by peer");
    }
    const auto n = std::min(nbytes, good_bytes_ - position_);
    position_ += n;
    return arrow::Buffer::FromString(std::string(static_cast<std::size_t>(n), 'x'));
  }

 private:
  int64_t good_bytes_;
  int64_t position_ = 0;
  bool    closed_   = false;
};

// ------------------------------------------------------------------
// Listings
// ------------------------------------------------------------------

class VectorListing final : public storage::ObjectListing {
 public:
  explicit VectorListing(std::vector<model::SourceObjectRef> refs, std::optional<std::size_t> fail_at = std::nullopt)
      : refs_(std::move(refs)), fail_at_(fail_at) {
  }

  std::optional<model::SourceObjectRef> Next() override {
    if (fail_at_ && next_ == *fail_at_) {
      throw util::TransientIOError("listing page request failed");
    }
    if (next_ >= refs_.size()) return std::nullopt;
    return refs_[next_++];
  }

 private:
  std::vector<model::SourceObjectRef> refs_;
  std::optional<std::size_t>          fail_at_;
  std::size_t                         next_ = 0;
};

// ------------------------------------------------------------------
// Context
// ------------------------------------------------------------------

inline transfer::RetryOptions FastRetry(uint32_t max_attempts = 3) {
  transfer::RetryOptions options;
  options.max_attempts = max_attempts;
  options.base_delay   = std::chrono::milliseconds(1);
  options.multiplier   = 2.0;
  options.max_delay    = std::chrono::milliseconds(5);
  options.jitter_ratio = 0.0;
  return options;
}

struct ContextOptions {
  transfer::RetryOptions               retry            = FastRetry();
  uint64_t                             bytes_per_second = 0;
  int64_t                              chunk_bytes      = 64 * 1024;
  std::optional<std::filesystem::path> staging_dir;
  std::string                          destination_prefix;
};

inline std::shared_ptr<transfer::ExecutionContext> MakeContext(storage::ObjectSourcePtr source, storage::ObjectSinkPtr sink,
                                                               const ContextOptions& options = {}) {
  auto ctx     = std::make_shared<transfer::ExecutionContext>();
  ctx->source  = std::move(source);
  ctx->sink    = std::move(sink);
  ctx->limiter = std::make_shared<transfer::BandwidthLimiter>(options.bytes_per_second, static_cast<uint64_t>(options.chunk_bytes));
  ctx->retry   = transfer::RetryPolicy(options.retry);
  ctx->staging = std::make_shared<transfer::StagingArea>(options.staging_dir.value_or(std::filesystem::path{}), !options.staging_dir.has_value(),
                                                         options.chunk_bytes);
  ctx->settings.chunk_bytes        = options.chunk_bytes;
  ctx->settings.destination_prefix = options.destination_prefix;
  ctx->cancel                      = std::make_shared<transfer::CancellationToken>();
  return ctx;
}

inline migrator::runtime::config::RuntimeConfig MakeConfig(const std::string& container, const std::string& bucket, uint32_t workers,
                                                          uint32_t bandwidth_mb) {
  migrator::runtime::config::RuntimeConfig config;
  config.mutable_source()->set_container(container);
  config.mutable_destination()->set_bucket(bucket);
  config.mutable_destination()->set_region("us-east-1");
  config.mutable_transfer()->set_max_workers(workers);
  config.mutable_transfer()->set_bandwidth_limit_mb(bandwidth_mb);
  config.mutable_transfer()->set_chunk_bytes(64 * 1024);
  config.mutable_retry()->set_max_attempts(3);
  config.mutable_retry()->set_base_delay_ms(1);
  config.mutable_retry()->set_max_delay_ms(5);
  config.mutable_retry()->set_jitter_ratio(0.0);
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_file_enabled(false);
  return config;
}

} // namespace migrator::testing
