#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "internal/model/transfer_task.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/blocking_queue.hpp"
#include "internal/transfer/execution_context.hpp"

namespace migrator::transfer {

struct RunResults {
  std::vector<model::TransferResult> results;

  // unique keys taken from the listing; every one has exactly one result
  uint64_t listed     = 0;
  uint64_t duplicates = 0;

  uint64_t skipped           = 0;
  uint64_t succeeded         = 0;
  uint64_t failed            = 0;
  uint64_t bytes_transferred = 0;

  bool        cancelled = false;
  std::string cancel_reason;
};

// Invoked on the aggregator thread, once per result, in completion order.
using ResultObserver = std::function<void(const model::TransferResult&)>;

/*
  Fixed-size pool of transfer threads.

      caller thread  : listing → task queue (bounded, 2 x concurrency)
      worker threads : task queue → TransferWorker → result channel
      aggregator     : result channel → tallies / observer

  Once the run is cancelled nothing new is executed: queued and not yet
  listed objects come back as Failed(cancelled) without touching a store.
*/
class WorkerPool {
 public:
  WorkerPool(ExecutionContextPtr ctx, uint32_t concurrency);

  /*
    Blocks until the listing is exhausted and every task has a result.

    A listing failure is rethrown after all threads are joined, unless the
    run had already been cancelled.
  */
  RunResults Run(storage::ObjectListing& listing, const ResultObserver& observer = {});

  uint32_t concurrency() const {
    return concurrency_;
  }

 private:
  void WorkerLoop(uint32_t index, BlockingQueue<model::TransferTask>& tasks, BlockingQueue<model::TransferResult>& results);

  bool        Cancelled() const;
  std::string CancelReason() const;

  ExecutionContextPtr ctx_;
  uint32_t            concurrency_;
  uint64_t            seed_;
};

} // namespace migrator::transfer
