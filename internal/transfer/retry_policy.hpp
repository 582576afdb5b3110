#pragma once

#include <chrono>
#include <cstdint>
#include <random>

#include "internal/util/errors.hpp"

namespace migrator::transfer {

struct RetryOptions {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds base_delay{2000};
  double                    multiplier = 2.0;
  std::chrono::milliseconds max_delay{60000};
  double                    jitter_ratio = 0.2;
};

struct RetryDecision {
  bool                      retry = false;
  std::chrono::milliseconds delay{0};

  static RetryDecision GiveUp() {
    return {};
  }
  static RetryDecision Retry(std::chrono::milliseconds delay) {
    return {true, delay};
  }
};

/*
  Stateless backoff decision.

  attempt is the number of attempts already made (1 after the first
  failure). Delay for a retryable error is

      min(max_delay, base_delay * multiplier^(attempt - 1))

  Jitter is left to the caller (ApplyJitter) so the decision itself stays
  deterministic.
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryOptions options = {});

  RetryDecision ShouldRetry(uint32_t attempt, util::ErrorKind kind) const;

  static bool IsFatal(util::ErrorKind kind);

  const RetryOptions& options() const {
    return options_;
  }

 private:
  RetryOptions options_;
};

// Spreads delay uniformly over [delay, delay * (1 + ratio)].
std::chrono::milliseconds ApplyJitter(std::chrono::milliseconds delay, double ratio, std::mt19937_64& rng);

} // namespace migrator::transfer
