#include "errors.hpp"

namespace migrator::util {

ErrorKind Classify(const std::exception& error) {
  if (dynamic_cast<const TransientIOError*>(&error)) return ErrorKind::kTransientIO;
  if (dynamic_cast<const AuthExpired*>(&error)) return ErrorKind::kAuthExpired;
  if (dynamic_cast<const DestinationMissing*>(&error)) return ErrorKind::kDestinationMissing;
  if (dynamic_cast<const ChecksumComputationError*>(&error)) return ErrorKind::kChecksum;
  if (dynamic_cast<const InvalidInput*>(&error)) return ErrorKind::kInvalidInput;
  if (dynamic_cast<const std::invalid_argument*>(&error)) return ErrorKind::kInvalidInput;
  return ErrorKind::kUnknown;
}

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTransientIO:
      return "transient_io";
    case ErrorKind::kAuthExpired:
      return "auth_expired";
    case ErrorKind::kDestinationMissing:
      return "destination_missing";
    case ErrorKind::kChecksum:
      return "checksum";
    case ErrorKind::kInvalidInput:
      return "invalid_input";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kUnknown:
    default:
      return "unknown";
  }
}

} // namespace migrator::util
