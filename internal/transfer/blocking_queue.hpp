#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace migrator::transfer {

/*
  Thread-safe blocking queue shared by the feeder, the workers and the
  aggregator.

  capacity 0 means unbounded. Enqueue blocks while the queue is full and
  returns false once the queue is shut down. Dequeue keeps handing out
  queued items after Shutdown() and returns nullopt only when empty.
*/
template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  bool Enqueue(T item) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [&] { return shutdown_ || capacity_ == 0 || queue_.size() < capacity_; });
      if (shutdown_) return false;
      queue_.push(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

 private:
  const std::size_t       capacity_;
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace migrator::transfer
