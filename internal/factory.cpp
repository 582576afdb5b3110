#include "factory.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/arrow/arrow_object_store.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace migrator::factory {

using migrator::observability::IntField;
using migrator::observability::StringField;

transfer::RetryOptions RetryOptionsFrom(const migrator::runtime::config::RetryConfig& config) {
  transfer::RetryOptions options;
  if (config.max_attempts() > 0) options.max_attempts = config.max_attempts();
  if (config.base_delay_ms() > 0) options.base_delay = std::chrono::milliseconds(config.base_delay_ms());
  if (config.multiplier() > 0) options.multiplier = config.multiplier();
  if (config.max_delay_ms() > 0) options.max_delay = std::chrono::milliseconds(config.max_delay_ms());
  if (config.has_jitter_ratio()) options.jitter_ratio = config.jitter_ratio();
  return options;
}

storage::ObjectSourcePtr BuildSource(const migrator::runtime::config::RuntimeConfig& config) {
  const auto& source = config.source();
  auto [fs, path]    = storage::common::Unwrap(storage::common::ResolveFileSystem(source.store(), {}), "resolve source " + source.store().uri());

  auto root = storage::common::JoinObjectPath(path, source.container());
  return std::make_shared<storage::ArrowObjectSource>(std::move(fs), std::move(root));
}

storage::ObjectSinkPtr BuildSink(const migrator::runtime::config::RuntimeConfig& config) {
  const auto& destination = config.destination();
  auto [fs, path]         = storage::common::Unwrap(storage::common::ResolveFileSystem(destination.store(), destination.region()),
                                                    "resolve destination " + destination.store().uri());

  auto root = storage::common::JoinObjectPath(path, destination.bucket());
  return std::make_shared<storage::ArrowObjectSink>(std::move(fs), std::move(root));
}

Application Build(const migrator::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildSource(config), BuildSink(config));
}

Application Build(const migrator::runtime::config::RuntimeConfig& config, storage::ObjectSourcePtr source, storage::ObjectSinkPtr sink) {
  const auto& transfer_config = config.transfer();
  const auto  chunk_bytes =
      transfer_config.chunk_bytes() > 0 ? static_cast<int64_t>(transfer_config.chunk_bytes()) : transfer::TransferSettings{}.chunk_bytes;

  // ------------------------------------------------------------------
  // Shared run state
  // ------------------------------------------------------------------
  const uint64_t bytes_per_second = static_cast<uint64_t>(transfer_config.bandwidth_limit_mb()) * transfer::BandwidthLimiter::kBytesPerMegabyte;

  auto ctx     = std::make_shared<transfer::ExecutionContext>();
  ctx->source  = std::move(source);
  ctx->sink    = std::move(sink);
  ctx->limiter = std::make_shared<transfer::BandwidthLimiter>(bytes_per_second, static_cast<uint64_t>(chunk_bytes));
  ctx->retry   = transfer::RetryPolicy(RetryOptionsFrom(config.retry()));
  ctx->staging = std::make_shared<transfer::StagingArea>(config.staging().directory(), config.staging().in_memory(), chunk_bytes);
  ctx->settings.chunk_bytes        = chunk_bytes;
  ctx->settings.destination_prefix = transfer_config.destination_prefix();
  ctx->cancel                      = std::make_shared<transfer::CancellationToken>();

  MIGRATOR_LOG_DEBUG("Execution context ready", {IntField("bytes_per_second", bytes_per_second), IntField("burst_bytes", ctx->limiter->BurstBytes()),
                                                 IntField("max_attempts", ctx->retry.options().max_attempts),
                                                 StringField("staging", config.staging().directory())});

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  Application app;
  app.context = ctx;
  app.engine  = std::make_unique<core::MigrationEngine>(ctx, std::max<uint32_t>(transfer_config.max_workers(), 1),
                                                        config.verification().verify_fingerprints());
  return app;
}

} // namespace migrator::factory
