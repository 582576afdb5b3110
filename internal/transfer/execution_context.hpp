#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"
#include "internal/transfer/bandwidth_limiter.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "internal/transfer/staging.hpp"

namespace migrator::transfer {

struct TransferSettings {
  int64_t     chunk_bytes = 8 * 1024 * 1024;
  std::string destination_prefix;
};

/*
  Everything a worker needs, built once per run and shared read-only.

  Only the limiter and the cancellation token carry mutable state, and
  both synchronise internally.
*/
struct ExecutionContext {
  storage::ObjectSourcePtr           source;
  storage::ObjectSinkPtr             sink;
  std::shared_ptr<BandwidthLimiter>  limiter;
  RetryPolicy                        retry;
  std::shared_ptr<StagingArea>       staging;
  TransferSettings                   settings;
  std::shared_ptr<CancellationToken> cancel;
};

using ExecutionContextPtr = std::shared_ptr<const ExecutionContext>;

} // namespace migrator::transfer
