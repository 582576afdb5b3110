#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/model/transfer_state.hpp"
#include "internal/util/errors.hpp"

namespace migrator::model {

/*
  One object as reported by the source listing.

  fingerprint is set only when the listing itself carries a content hash.
*/
struct SourceObjectRef {
  std::string                key;
  uint64_t                   size_bytes = 0;
  std::optional<std::string> fingerprint;
};

/*
  Work item owned by exactly one worker for its lifetime.
*/
struct TransferTask {
  SourceObjectRef       source;
  std::string           destination_key;
  std::filesystem::path staging_path;

  // push attempts; bounded by the retry policy's max_attempts
  uint32_t attempts       = 0;
  uint32_t stage_attempts = 0;

  TaskState state = TaskState::kPending;
};

enum class Outcome : std::uint8_t {
  kSkipped   = 0,
  kSucceeded = 1,
  kFailed    = 2,
};

constexpr std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kSkipped:
      return "skipped";
    case Outcome::kSucceeded:
      return "succeeded";
    case Outcome::kFailed:
      return "failed";
  }
  return "unknown";
}

struct TransferResult {
  std::string key;
  std::string destination_key;
  Outcome     outcome = Outcome::kFailed;

  uint64_t size_bytes        = 0;
  uint64_t bytes_transferred = 0;
  uint32_t attempts          = 0;

  // fingerprint of the bytes that were compared / pushed
  std::optional<std::string> source_fingerprint;

  std::optional<util::ErrorKind> error_kind;
  std::string                    error;
};

} // namespace migrator::model
