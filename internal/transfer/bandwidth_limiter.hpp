#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace migrator::transfer {

/*
  Global outbound rate limiter shared by every worker.

  Token bucket refilled continuously at bytes_per_second, holding at most
  burst_bytes. A request larger than the available tokens runs the bucket
  into debt and sleeps until the debt is repaid, so oversized requests
  still complete and later callers pay for them.

  A rate of zero disables throttling.
*/
class BandwidthLimiter {
 public:
  static constexpr uint64_t kBytesPerMegabyte = 1024 * 1024;

  BandwidthLimiter(uint64_t bytes_per_second, uint64_t burst_bytes);

  BandwidthLimiter(const BandwidthLimiter&)            = delete;
  BandwidthLimiter& operator=(const BandwidthLimiter&) = delete;

  // blocks until bytes may be sent without exceeding the configured rate
  void Acquire(uint64_t bytes);

  uint64_t BytesPerSecond() const {
    return bytes_per_second_;
  }
  uint64_t BurstBytes() const {
    return burst_bytes_;
  }

 private:
  using Clock = std::chrono::steady_clock;

  void RefillLocked(Clock::time_point now);

  const uint64_t bytes_per_second_;
  const uint64_t burst_bytes_;

  std::mutex        mutex_;
  double            tokens_;
  Clock::time_point last_refill_;
};

} // namespace migrator::transfer
