#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "internal/model/transfer_task.hpp"
#include "internal/transfer/execution_context.hpp"

namespace migrator::transfer {

/*
  Runs one object's pipeline:

      stage (retried in place) → fingerprint + head → gate → push (retried)

  A worker is owned by exactly one pool thread; the task passed to Execute
  is exclusively owned by that call. Execute never throws: every failure
  becomes a Failed result.
*/
class TransferWorker {
 public:
  TransferWorker(ExecutionContextPtr ctx, uint64_t seed);

  model::TransferResult Execute(model::TransferTask& task);

 private:
  model::TransferResult RunPipeline(model::TransferTask& task);

  std::optional<StagedObject> StageWithRetry(model::TransferTask& task, model::TransferResult& result);

  bool PushWithRetry(model::TransferTask& task, const StagedObject& staged, model::TransferResult& result);

  void Transition(model::TransferTask& task, model::TaskState to) const;

  void Fail(model::TransferTask& task, model::TransferResult& result, util::ErrorKind kind, const std::string& message) const;

  // raises run-wide cancellation for kinds that make every other task pointless
  void Escalate(util::ErrorKind kind, const std::string& message) const;

  bool Cancelled() const;

  void Backoff(std::chrono::milliseconds delay);

  ExecutionContextPtr ctx_;
  std::mt19937_64     rng_;
};

// Result for a task that was never executed because the run was cancelled.
model::TransferResult CancelledResult(const model::SourceObjectRef& source, const std::string& reason);

} // namespace migrator::transfer
