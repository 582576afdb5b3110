#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <random>
#include <thread>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/transfer/transfer_worker.hpp"

namespace migrator::transfer {

using migrator::model::Outcome;
using migrator::model::TransferResult;
using migrator::model::TransferTask;
using migrator::observability::IntField;
using migrator::observability::StringField;

namespace {

TransferResult WorkerFailure(const TransferTask& task, const std::exception& error) {
  TransferResult result;
  result.key             = task.source.key;
  result.destination_key = task.destination_key;
  result.size_bytes      = task.source.size_bytes;
  result.attempts        = task.attempts;
  result.outcome         = Outcome::kFailed;
  result.error_kind      = util::Classify(error);
  result.error           = error.what();
  return result;
}

} // namespace

WorkerPool::WorkerPool(ExecutionContextPtr ctx, uint32_t concurrency)
    : ctx_(std::move(ctx)), concurrency_(std::max<uint32_t>(concurrency, 1)), seed_(std::random_device{}()) {
}

bool WorkerPool::Cancelled() const {
  return ctx_->cancel && ctx_->cancel->IsCancelled();
}

std::string WorkerPool::CancelReason() const {
  return ctx_->cancel ? ctx_->cancel->Reason() : std::string{};
}

void WorkerPool::WorkerLoop(uint32_t index, BlockingQueue<TransferTask>& tasks, BlockingQueue<TransferResult>& results) {
  TransferWorker worker(ctx_, seed_ + index);

  while (auto task = tasks.Dequeue()) {
    TransferResult result;
    if (Cancelled()) {
      result = CancelledResult(task->source, CancelReason());
    } else {
      try {
        result = worker.Execute(*task);
      } catch (const std::exception& e) {
        result = WorkerFailure(*task, e);
        MIGRATOR_LOG_ERROR("Worker failed", {IntField("worker", index), StringField("key", task->source.key), StringField("error", e.what())});
      }
    }
    results.Enqueue(std::move(result));
  }
}

RunResults WorkerPool::Run(storage::ObjectListing& listing, const ResultObserver& observer) {
  BlockingQueue<TransferTask>   tasks(static_cast<std::size_t>(concurrency_) * 2);
  BlockingQueue<TransferResult> results;

  RunResults out;

  std::thread aggregator([&] {
    while (auto result = results.Dequeue()) {
      switch (result->outcome) {
        case Outcome::kSkipped:
          ++out.skipped;
          break;
        case Outcome::kSucceeded:
          ++out.succeeded;
          break;
        case Outcome::kFailed:
          ++out.failed;
          break;
      }
      out.bytes_transferred += result->bytes_transferred;

      if (observer) {
        try {
          observer(*result);
        } catch (const std::exception& e) {
          MIGRATOR_LOG_WARN("Result observer failed", {StringField("key", result->key), StringField("error", e.what())});
        }
      }
      out.results.push_back(std::move(*result));
    }
  });

  std::vector<std::thread> workers;
  workers.reserve(concurrency_);
  for (uint32_t i = 0; i < concurrency_; ++i) {
    workers.emplace_back(&WorkerPool::WorkerLoop, this, i, std::ref(tasks), std::ref(results));
  }

  MIGRATOR_LOG_INFO("Worker pool started", {IntField("workers", concurrency_)});

  // ------------------------------------------------------------------
  // Feed
  // ------------------------------------------------------------------
  std::exception_ptr              listing_error;
  std::unordered_set<std::string> seen;
  try {
    while (auto ref = listing.Next()) {
      if (!seen.insert(ref->key).second) {
        ++out.duplicates;
        MIGRATOR_LOG_WARN("Duplicate key in source listing, ignoring", {StringField("key", ref->key)});
        continue;
      }
      ++out.listed;

      if (Cancelled()) {
        results.Enqueue(CancelledResult(*ref, CancelReason()));
        continue;
      }

      TransferTask task;
      task.source = std::move(*ref);
      tasks.Enqueue(std::move(task));
    }
  } catch (const std::exception& e) {
    MIGRATOR_LOG_ERROR("Source listing failed", {StringField("error", e.what())});
    listing_error = std::current_exception();
  }

  tasks.Shutdown();
  for (auto& worker : workers) {
    worker.join();
  }
  results.Shutdown();
  aggregator.join();

  out.cancelled     = Cancelled();
  out.cancel_reason = CancelReason();

  MIGRATOR_LOG_INFO("Worker pool drained", {IntField("listed", out.listed), IntField("succeeded", out.succeeded), IntField("skipped", out.skipped),
                                            IntField("failed", out.failed), IntField("bytes", out.bytes_transferred)});

  if (listing_error && !out.cancelled) {
    std::rethrow_exception(listing_error);
  }
  return out;
}

} // namespace migrator::transfer
