#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace migrator::transfer {

/*
  Run-wide cancellation flag.

  Raised once by the first fatal error; every later Cancel() keeps the
  original reason. Checked between pipeline steps and before dispatch,
  never used to interrupt a store call.
*/
class CancellationToken {
 public:
  void Cancel(const std::string& reason) {
    std::lock_guard lock(mutex_);
    if (cancelled_.load()) return;
    reason_ = reason;
    cancelled_.store(true);
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  std::string Reason() const {
    std::lock_guard lock(mutex_);
    return reason_;
  }

 private:
  std::atomic<bool>  cancelled_{false};
  mutable std::mutex mutex_;
  std::string        reason_;
};

} // namespace migrator::transfer
