#include "migration_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace migrator::core {

using migrator::observability::BoolField;
using migrator::observability::DoubleField;
using migrator::observability::IntField;
using migrator::observability::StringField;

namespace {

struct StagingCleanup {
  transfer::StagingArea& staging;

  ~StagingCleanup() {
    staging.Cleanup();
  }
};

} // namespace

int MigrationSummary::ExitCode() const {
  if (run.cancelled) {
    return 2;
  }
  if (run.failed > 0) {
    return 3;
  }
  if (verification && !verification->matched) {
    return 3;
  }
  return 0;
}

MigrationEngine::MigrationEngine(transfer::ExecutionContextPtr ctx, uint32_t concurrency, bool verify_fingerprints)
    : ctx_(std::move(ctx)), concurrency_(concurrency), verify_fingerprints_(verify_fingerprints) {
}

MigrationSummary MigrationEngine::Run(const transfer::ResultObserver& observer) {
  observability::SpanScope span("migrator.run");
  const auto               started = std::chrono::steady_clock::now();

  MIGRATOR_LOG_INFO("Starting migration", {StringField("source", ctx_->source->Describe()), StringField("destination", ctx_->sink->Describe()),
                                           IntField("workers", concurrency_)});

  // ------------------------------------------------------------------
  // Pre-flight
  // ------------------------------------------------------------------
  if (!ctx_->sink->BucketExists()) {
    MIGRATOR_LOG_ERROR("Destination bucket does not exist. Aborting", {StringField("destination", ctx_->sink->Describe())});
    span.RecordException("destination missing");
    throw util::DestinationMissing("destination bucket does not exist: " + ctx_->sink->Describe());
  }

  ctx_->staging->Prepare();
  StagingCleanup cleanup{*ctx_->staging};

  // ------------------------------------------------------------------
  // Transfer
  // ------------------------------------------------------------------
  MigrationSummary summary;
  auto             listing = ctx_->source->List();

  transfer::WorkerPool pool(ctx_, concurrency_);
  summary.run = pool.Run(*listing, observer);

  span.AddEvent("transfers.drained");
  span.SetAttribute("objects.listed", static_cast<std::int64_t>(summary.run.listed));
  if (summary.run.listed == 0) {
    MIGRATOR_LOG_WARN("No objects found in source container", {StringField("source", ctx_->source->Describe())});
    return summary;
  }

  if (summary.run.cancelled) {
    MIGRATOR_LOG_ERROR("Migration cancelled", {StringField("reason", summary.run.cancel_reason)});
  }

  // ------------------------------------------------------------------
  // Reconcile
  // ------------------------------------------------------------------
  transfer::Verifier verifier(ctx_->sink, verify_fingerprints_);
  summary.verification = verifier.Reconcile(summary.run.listed, summary.run.results);

  MIGRATOR_LOG_INFO("Migration finished", {IntField("succeeded", summary.run.succeeded), IntField("skipped", summary.run.skipped),
                                           IntField("failed", summary.run.failed), IntField("bytes", summary.run.bytes_transferred),
                                           BoolField("matched", summary.verification->matched), DoubleField("elapsed_ms", util::ElapsedMillis(started))});
  return summary;
}

} // namespace migrator::core
