#include "internal/transfer/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using migrator::transfer::ApplyJitter;
using migrator::transfer::RetryOptions;
using migrator::transfer::RetryPolicy;
using migrator::util::ErrorKind;
using std::chrono::milliseconds;

void TestDefaultCurve() {
  RetryPolicy policy;

  auto first = policy.ShouldRetry(1, ErrorKind::kTransientIO);
  assert(first.retry);
  assert(first.delay == milliseconds(2000));

  auto second = policy.ShouldRetry(2, ErrorKind::kTransientIO);
  assert(second.retry);
  assert(second.delay == milliseconds(4000));

  // third attempt was the last one allowed
  assert(!policy.ShouldRetry(3, ErrorKind::kTransientIO).retry);
  assert(!policy.ShouldRetry(7, ErrorKind::kTransientIO).retry);
}

void TestFatalKindsNeverRetry() {
  RetryOptions options;
  options.max_attempts = 10;
  RetryPolicy policy(options);

  for (auto kind : {ErrorKind::kAuthExpired, ErrorKind::kDestinationMissing, ErrorKind::kInvalidInput, ErrorKind::kCancelled}) {
    assert(RetryPolicy::IsFatal(kind));
    assert(!policy.ShouldRetry(1, kind).retry);
  }

  assert(!RetryPolicy::IsFatal(ErrorKind::kTransientIO));
  assert(!RetryPolicy::IsFatal(ErrorKind::kUnknown));
  assert(policy.ShouldRetry(1, ErrorKind::kUnknown).retry);
}

void TestDelayIsCapped() {
  RetryOptions options;
  options.max_attempts = 8;
  options.base_delay   = milliseconds(1000);
  options.multiplier   = 10.0;
  options.max_delay    = milliseconds(5000);
  RetryPolicy policy(options);

  assert(policy.ShouldRetry(1, ErrorKind::kTransientIO).delay == milliseconds(1000));
  assert(policy.ShouldRetry(2, ErrorKind::kTransientIO).delay == milliseconds(5000));
  assert(policy.ShouldRetry(6, ErrorKind::kTransientIO).delay == milliseconds(5000));
}

void TestAtLeastOneAttempt() {
  RetryOptions options;
  options.max_attempts = 0;
  RetryPolicy policy(options);

  assert(policy.options().max_attempts == 1);
  assert(!policy.ShouldRetry(1, ErrorKind::kTransientIO).retry);
}

void TestJitterStaysInRange() {
  std::mt19937_64 rng(42);
  for (int i = 0; i < 1000; ++i) {
    auto delay = ApplyJitter(milliseconds(1000), 0.2, rng);
    assert(delay >= milliseconds(1000));
    assert(delay <= milliseconds(1200));
  }
  assert(ApplyJitter(milliseconds(1000), 0.0, rng) == milliseconds(1000));
  assert(ApplyJitter(milliseconds(0), 0.5, rng) == milliseconds(0));
}

void TestClassify() {
  using namespace migrator::util;

  assert(Classify(TransientIOError("reset")) == ErrorKind::kTransientIO);
  assert(Classify(AuthExpired("token")) == ErrorKind::kAuthExpired);
  assert(Classify(DestinationMissing("bucket")) == ErrorKind::kDestinationMissing);
  assert(Classify(ChecksumComputationError("md5")) == ErrorKind::kChecksum);
  assert(Classify(InvalidInput("key")) == ErrorKind::kInvalidInput);
  assert(Classify(std::invalid_argument("arg")) == ErrorKind::kInvalidInput);
  assert(Classify(std::runtime_error("other")) == ErrorKind::kUnknown);

  assert(EscalatesToCancellation(ErrorKind::kAuthExpired));
  assert(EscalatesToCancellation(ErrorKind::kDestinationMissing));
  assert(!EscalatesToCancellation(ErrorKind::kInvalidInput));
  assert(!EscalatesToCancellation(ErrorKind::kTransientIO));
}

} // namespace

int main() {
  TestDefaultCurve();
  TestFatalKindsNeverRetry();
  TestDelayIsCapped();
  TestAtLeastOneAttempt();
  TestJitterStaysInRange();
  TestClassify();

  std::cout << "object_migrator_unit_retry_policy: pass\n";
  return 0;
}
