#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/migration_engine.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/execution_context.hpp"

namespace migrator::factory {

/*
  Application

  Everything one run needs. The context is immutable once built and is
  shared by the engine, the pool and every worker.
*/
struct Application {
  transfer::ExecutionContextPtr          context;
  std::unique_ptr<core::MigrationEngine> engine;
};

transfer::RetryOptions RetryOptionsFrom(const migrator::runtime::config::RetryConfig& config);

storage::ObjectSourcePtr BuildSource(const migrator::runtime::config::RuntimeConfig& config);
storage::ObjectSinkPtr   BuildSink(const migrator::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. Expects a validated config (ConfigLoader::Validate).
  The second overload takes already constructed stores.
*/
Application Build(const migrator::runtime::config::RuntimeConfig& config);
Application Build(const migrator::runtime::config::RuntimeConfig& config, storage::ObjectSourcePtr source, storage::ObjectSinkPtr sink);

} // namespace migrator::factory
