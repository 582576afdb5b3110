#pragma once

#include <cstdint>
#include <optional>

#include "internal/transfer/execution_context.hpp"
#include "internal/transfer/verifier.hpp"
#include "internal/transfer/worker_pool.hpp"

namespace migrator::core {

struct MigrationSummary {
  transfer::RunResults run;

  // absent when the source listing was empty
  std::optional<transfer::VerificationReport> verification;

  /*
    0  every object skipped or transferred and counts reconcile
    2  run cancelled by a fatal error
    3  failed objects or reconciliation mismatch
  */
  int ExitCode() const;
};

/*
  One complete run:

      pre-flight (destination exists) → staging → pool → reconcile

  Pre-flight failures throw util::DestinationMissing before any task is
  created. The staging area is removed on every exit path.
*/
class MigrationEngine {
 public:
  MigrationEngine(transfer::ExecutionContextPtr ctx, uint32_t concurrency, bool verify_fingerprints);

  MigrationSummary Run(const transfer::ResultObserver& observer = {});

 private:
  transfer::ExecutionContextPtr ctx_;
  uint32_t                      concurrency_;
  bool                          verify_fingerprints_;
};

} // namespace migrator::core
