#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace migrator::transfer {

using util::ErrorKind;

RetryPolicy::RetryPolicy(RetryOptions options) : options_(options) {
  options_.max_attempts = std::max<uint32_t>(options_.max_attempts, 1);
  options_.multiplier   = std::max(options_.multiplier, 1.0);
}

bool RetryPolicy::IsFatal(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kAuthExpired:
    case ErrorKind::kDestinationMissing:
    case ErrorKind::kInvalidInput:
    case ErrorKind::kCancelled:
      return true;
    case ErrorKind::kTransientIO:
    case ErrorKind::kChecksum:
    case ErrorKind::kUnknown:
    default:
      return false;
  }
}

RetryDecision RetryPolicy::ShouldRetry(uint32_t attempt, ErrorKind kind) const {
  if (IsFatal(kind)) {
    return RetryDecision::GiveUp();
  }
  if (attempt >= options_.max_attempts) {
    return RetryDecision::GiveUp();
  }

  const double exponent = static_cast<double>(std::max<uint32_t>(attempt, 1) - 1);
  const double scaled   = static_cast<double>(options_.base_delay.count()) * std::pow(options_.multiplier, exponent);
  const double capped   = std::min(scaled, static_cast<double>(options_.max_delay.count()));

  return RetryDecision::Retry(std::chrono::milliseconds(static_cast<int64_t>(capped)));
}

std::chrono::milliseconds ApplyJitter(std::chrono::milliseconds delay, double ratio, std::mt19937_64& rng) {
  if (ratio <= 0 || delay.count() <= 0) {
    return delay;
  }
  std::uniform_real_distribution<double> spread(0.0, ratio);
  const auto extra = static_cast<int64_t>(static_cast<double>(delay.count()) * spread(rng));
  return delay + std::chrono::milliseconds(extra);
}

} // namespace migrator::transfer
