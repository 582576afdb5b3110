#include "internal/transfer/bandwidth_limiter.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using migrator::transfer::BandwidthLimiter;
using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

void TestZeroRateDoesNotThrottle() {
  BandwidthLimiter limiter(0, 1024);
  const auto       start = Clock::now();
  for (int i = 0; i < 1000; ++i) {
    limiter.Acquire(1 << 20);
  }
  assert(SecondsSince(start) < 0.5);
}

void TestBurstClampedToOneSecond() {
  BandwidthLimiter limiter(1000, 5000);
  assert(limiter.BurstBytes() == 1000);
  assert(limiter.BytesPerSecond() == 1000);

  BandwidthLimiter tiny(1000, 0);
  assert(tiny.BurstBytes() == 1);
}

void TestBurstIsImmediateThenRateLimited() {
  BandwidthLimiter limiter(100000, 10000);

  const auto start = Clock::now();
  limiter.Acquire(10000);
  assert(SecondsSince(start) < 0.1);

  // 50 KB more at 100 KB/s
  for (int i = 0; i < 5; ++i) {
    limiter.Acquire(10000);
  }
  const auto elapsed = SecondsSince(start);
  assert(elapsed >= 0.45);
  assert(elapsed < 2.0);
}

void TestOversizedRequestCompletes() {
  BandwidthLimiter limiter(1000, 100);

  const auto start = Clock::now();
  limiter.Acquire(500);
  const auto elapsed = SecondsSince(start);
  assert(elapsed >= 0.3);
  assert(elapsed < 2.0);
}

void TestCeilingHoldsAcrossThreads() {
  constexpr uint64_t kRate      = 1000000;
  constexpr uint64_t kChunk     = 20000;
  constexpr int      kThreads   = 4;
  constexpr int      kPerThread = 25;

  BandwidthLimiter limiter(kRate, kChunk);

  const auto               start = Clock::now();
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        limiter.Acquire(kChunk);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  // 2,000,000 bytes at 1,000,000 B/s with one chunk of burst
  const auto elapsed = SecondsSince(start);
  assert(elapsed >= 1.9);
  assert(elapsed < 5.0);
}

} // namespace

int main() {
  TestZeroRateDoesNotThrottle();
  TestBurstClampedToOneSecond();
  TestBurstIsImmediateThenRateLimited();
  TestOversizedRequestCompletes();
  TestCeilingHoldsAcrossThreads();

  std::cout << "object_migrator_unit_bandwidth_limiter: pass\n";
  return 0;
}
