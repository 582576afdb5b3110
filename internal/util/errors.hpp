#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace migrator::util {

/*
  Central error types.

  Store adapters translate backend failures into these; the retry policy
  and the worker pool only ever look at ErrorKind.
*/

class TransientIOError : public std::runtime_error {
 public:
  explicit TransientIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuthExpired : public std::runtime_error {
 public:
  explicit AuthExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DestinationMissing : public std::runtime_error {
 public:
  explicit DestinationMissing(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ChecksumComputationError : public std::runtime_error {
 public:
  explicit ChecksumComputationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ErrorKind : std::uint8_t {
  kUnknown            = 0,
  kTransientIO        = 1,
  kAuthExpired        = 2,
  kDestinationMissing = 3,
  kChecksum           = 4,
  kInvalidInput       = 5,
  kCancelled          = 6,
};

// Fatal kinds make further attempts meaningless for the whole run.
constexpr bool EscalatesToCancellation(ErrorKind kind) {
  return kind == ErrorKind::kAuthExpired || kind == ErrorKind::kDestinationMissing;
}

ErrorKind        Classify(const std::exception& error);
std::string_view ToString(ErrorKind kind);

} // namespace migrator::util
