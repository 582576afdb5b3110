#include "transfer_worker.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/fingerprint.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/checksum_gate.hpp"
#include "internal/util/time.hpp"

namespace migrator::transfer {

using migrator::model::Outcome;
using migrator::model::TaskState;
using migrator::model::TransferResult;
using migrator::model::TransferTask;
using migrator::observability::IntField;
using migrator::observability::StringField;
using migrator::util::ErrorKind;

namespace {

constexpr const char* kContentType = "application/octet-stream";

std::string CancelMessage(const CancellationToken* token) {
  const auto reason = token ? token->Reason() : std::string{};
  return reason.empty() ? "run cancelled" : "run cancelled: " + reason;
}

} // namespace

TransferWorker::TransferWorker(ExecutionContextPtr ctx, uint64_t seed) : ctx_(std::move(ctx)), rng_(seed) {
}

model::TransferResult TransferWorker::Execute(TransferTask& task) {
  const auto               started = std::chrono::steady_clock::now();
  observability::SpanScope span("migrator.transfer");
  span.SetAttribute("object.key", task.source.key);
  span.SetAttribute("object.size_bytes", static_cast<std::int64_t>(task.source.size_bytes));

  TransferResult result;
  result.key             = task.source.key;
  result.destination_key = task.destination_key;
  result.size_bytes      = task.source.size_bytes;

  try {
    result = RunPipeline(task);
  } catch (const std::exception& e) {
    // anything that escaped the per-step handling (invalid key, bad state)
    const auto kind = util::Classify(e);
    Escalate(kind, e.what());
    Fail(task, result, kind, e.what());
  }
  result.attempts = task.attempts;

  const auto outcome = model::ToString(result.outcome);
  span.SetAttribute("transfer.outcome", outcome);
  if (result.outcome == Outcome::kFailed) {
    span.RecordException(result.error);
    MIGRATOR_LOG_ERROR("Transfer failed", {StringField("key", result.key), StringField("error_kind", util::ToString(*result.error_kind)),
                                           IntField("attempts", result.attempts), StringField("error", result.error)});
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordTransfer(outcome, result.bytes_transferred);
  metrics.ObserveTransferDurationMs(outcome, util::ElapsedMillis(started));
  return result;
}

model::TransferResult TransferWorker::RunPipeline(TransferTask& task) {
  TransferResult result;
  result.key        = task.source.key;
  result.size_bytes = task.source.size_bytes;

  if (task.destination_key.empty()) {
    task.destination_key = storage::common::DestinationKey(ctx_->settings.destination_prefix, task.source.key);
  }
  result.destination_key = task.destination_key;

  MIGRATOR_LOG_INFO("Starting transfer", {StringField("key", task.source.key), IntField("size_bytes", task.source.size_bytes)});

  if (Cancelled()) {
    Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
    return result;
  }

  // ------------------------------------------------------------------
  // Stage
  // ------------------------------------------------------------------
  auto staged = StageWithRetry(task, result);
  if (!staged) {
    return result;
  }
  task.staging_path = staged->path();

  if (Cancelled()) {
    Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
    return result;
  }

  // ------------------------------------------------------------------
  // Check
  // ------------------------------------------------------------------
  Transition(task, TaskState::kChecking);

  std::optional<std::string> fingerprint;
  try {
    fingerprint = storage::common::Md5Hex(*staged->data());
  } catch (const util::ChecksumComputationError& e) {
    MIGRATOR_LOG_WARN("Could not fingerprint staged object, transferring", {StringField("key", task.source.key), StringField("error", e.what())});
  }
  result.source_fingerprint = fingerprint;

  std::optional<storage::ObjectHead> head;
  try {
    head = ctx_->sink->Head(task.destination_key);
  } catch (const std::exception& e) {
    const auto kind = util::Classify(e);
    if (RetryPolicy::IsFatal(kind)) {
      Escalate(kind, e.what());
      Fail(task, result, kind, e.what());
      return result;
    }
    MIGRATOR_LOG_WARN("Destination lookup failed, transferring",
                      {StringField("key", task.destination_key), StringField("error", e.what())});
  }

  const auto decision = ChecksumGate::Decide(fingerprint, head ? head->fingerprint : std::nullopt);
  MIGRATOR_LOG_DEBUG("Checksum gate", {StringField("key", task.destination_key), StringField("decision", ToString(decision))});
  if (decision == GateDecision::kSkip) {
    Transition(task, TaskState::kSkipped);
    staged->Release();
    result.outcome = Outcome::kSkipped;
    MIGRATOR_LOG_INFO("Object is up to date in destination. Skipping upload", {StringField("key", task.destination_key)});
    return result;
  }

  if (head) {
    MIGRATOR_LOG_INFO("Object exists but has changed. Overwriting", {StringField("key", task.destination_key)});
  } else {
    MIGRATOR_LOG_INFO("Object does not exist in destination. Uploading", {StringField("key", task.destination_key)});
  }

  if (Cancelled()) {
    Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
    return result;
  }

  // ------------------------------------------------------------------
  // Push
  // ------------------------------------------------------------------
  Transition(task, TaskState::kPushing);
  if (PushWithRetry(task, *staged, result)) {
    Transition(task, TaskState::kDone);
    result.outcome           = Outcome::kSucceeded;
    result.bytes_transferred = static_cast<uint64_t>(staged->size());
    MIGRATOR_LOG_INFO("Object uploaded successfully",
                      {StringField("key", task.destination_key), IntField("attempt", task.attempts), IntField("bytes", staged->size())});
  }
  return result;
}

std::optional<StagedObject> TransferWorker::StageWithRetry(TransferTask& task, TransferResult& result) {
  Transition(task, TaskState::kStaging);

  while (true) {
    ++task.stage_attempts;
    try {
      auto input = ctx_->source->Fetch(task.source.key);
      return ctx_->staging->Stage(task.source.key, *input);
    } catch (const std::exception& e) {
      const auto kind     = util::Classify(e);
      const auto decision = ctx_->retry.ShouldRetry(task.stage_attempts, kind);
      if (!decision.retry) {
        Escalate(kind, e.what());
        Fail(task, result, kind, e.what());
        return std::nullopt;
      }

      const auto delay = ApplyJitter(decision.delay, ctx_->retry.options().jitter_ratio, rng_);
      MIGRATOR_LOG_WARN("Staging failed, retrying", {StringField("key", task.source.key), IntField("attempt", task.stage_attempts),
                                                     IntField("delay_ms", delay.count()), StringField("error", e.what())});
      observability::Metrics::Instance().RecordRetry("stage");
      Backoff(delay);

      if (Cancelled()) {
        Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
        return std::nullopt;
      }
    }
  }
}

bool TransferWorker::PushWithRetry(TransferTask& task, const StagedObject& staged, TransferResult& result) {
  storage::ObjectMetadata metadata{{"Content-Type", kContentType}};
  if (result.source_fingerprint) {
    metadata[storage::common::kContentMd5MetadataKey] = *result.source_fingerprint;
  }

  auto* limiter  = ctx_->limiter.get();
  auto  throttle = [limiter](int64_t bytes) {
    if (limiter) limiter->Acquire(static_cast<uint64_t>(bytes));
  };

  while (true) {
    ++task.attempts;
    try {
      ctx_->sink->Put(task.destination_key, staged.data(), metadata, ctx_->settings.chunk_bytes, throttle);
      return true;
    } catch (const std::exception& e) {
      const auto kind     = util::Classify(e);
      const auto decision = ctx_->retry.ShouldRetry(task.attempts, kind);
      if (!decision.retry) {
        Escalate(kind, e.what());
        Fail(task, result, kind, e.what());
        return false;
      }
      if (Cancelled()) {
        Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
        return false;
      }

      Transition(task, TaskState::kRetrying);
      const auto delay = ApplyJitter(decision.delay, ctx_->retry.options().jitter_ratio, rng_);
      MIGRATOR_LOG_WARN("Upload failed, retrying", {StringField("key", task.destination_key), IntField("attempt", task.attempts),
                                                    IntField("delay_ms", delay.count()), StringField("error", e.what())});
      observability::Metrics::Instance().RecordRetry("push");
      Backoff(delay);

      if (Cancelled()) {
        Fail(task, result, ErrorKind::kCancelled, CancelMessage(ctx_->cancel.get()));
        return false;
      }
      Transition(task, TaskState::kPushing);
    }
  }
}

void TransferWorker::Transition(TransferTask& task, TaskState to) const {
  if (!model::CanTransition(task.state, to)) {
    throw util::InvalidState("invalid task transition " + std::string(model::ToString(task.state)) + " -> " + std::string(model::ToString(to)) +
                             " for " + task.source.key);
  }
  task.state = to;
}

void TransferWorker::Fail(TransferTask& task, TransferResult& result, ErrorKind kind, const std::string& message) const {
  if (!model::IsTerminal(task.state)) {
    task.state = TaskState::kFailed;
  }
  result.outcome    = Outcome::kFailed;
  result.error_kind = kind;
  result.error      = message;
}

void TransferWorker::Escalate(ErrorKind kind, const std::string& message) const {
  if (!util::EscalatesToCancellation(kind) || !ctx_->cancel) {
    return;
  }
  if (!ctx_->cancel->IsCancelled()) {
    MIGRATOR_LOG_ERROR("Fatal error, cancelling remaining transfers", {StringField("error_kind", util::ToString(kind)), StringField("error", message)});
  }
  ctx_->cancel->Cancel(message);
}

bool TransferWorker::Cancelled() const {
  return ctx_->cancel && ctx_->cancel->IsCancelled();
}

void TransferWorker::Backoff(std::chrono::milliseconds delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

model::TransferResult CancelledResult(const model::SourceObjectRef& source, const std::string& reason) {
  TransferResult result;
  result.key        = source.key;
  result.size_bytes = source.size_bytes;
  result.outcome    = Outcome::kFailed;
  result.error_kind = ErrorKind::kCancelled;
  result.error      = reason.empty() ? "run cancelled" : "run cancelled: " + reason;
  return result;
}

} // namespace migrator::transfer
