#include "bandwidth_limiter.hpp"

#include <algorithm>
#include <thread>

namespace migrator::transfer {

BandwidthLimiter::BandwidthLimiter(uint64_t bytes_per_second, uint64_t burst_bytes)
    : bytes_per_second_(bytes_per_second),
      // burst never exceeds one second worth of rate
      burst_bytes_(std::max<uint64_t>(1, std::min(burst_bytes, bytes_per_second))),
      tokens_(static_cast<double>(burst_bytes_)),
      last_refill_(Clock::now()) {
}

void BandwidthLimiter::RefillLocked(Clock::time_point now) {
  const std::chrono::duration<double> elapsed = now - last_refill_;
  last_refill_                                = now;
  tokens_ = std::min(static_cast<double>(burst_bytes_), tokens_ + elapsed.count() * static_cast<double>(bytes_per_second_));
}

void BandwidthLimiter::Acquire(uint64_t bytes) {
  if (bytes_per_second_ == 0 || bytes == 0) {
    return;
  }

  std::chrono::duration<double> wait{0};
  {
    std::lock_guard lock(mutex_);
    RefillLocked(Clock::now());

    // reserve now, pay later: a negative balance is the time every later
    // caller has to wait behind this request
    tokens_ -= static_cast<double>(bytes);
    if (tokens_ < 0) {
      wait = std::chrono::duration<double>(-tokens_ / static_cast<double>(bytes_per_second_));
    }
  }

  if (wait.count() > 0) {
    std::this_thread::sleep_for(std::chrono::duration_cast<Clock::duration>(wait));
  }
}

} // namespace migrator::transfer
