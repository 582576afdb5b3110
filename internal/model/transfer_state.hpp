#pragma once

#include <cstdint>
#include <string_view>

namespace migrator::model {

/*
  Per-task pipeline state.

      Pending → Staging → Checking → Pushing → Done
                              │          │
                              ▼          ▼
                           Skipped    Retrying → Pushing → … → Failed
*/
enum class TaskState : std::uint8_t {
  kPending  = 0,
  kStaging  = 1,
  kChecking = 2,
  kPushing  = 3,
  kRetrying = 4,
  kDone     = 5,
  kSkipped  = 6,
  kFailed   = 7,
};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kDone || state == TaskState::kSkipped || state == TaskState::kFailed;
}

constexpr bool CanTransition(TaskState from, TaskState to) {
  if (IsTerminal(from)) {
    return false;
  }
  // cancellation, staging exhaustion and fatal errors may end any live task
  if (to == TaskState::kFailed) {
    return true;
  }

  switch (from) {
    case TaskState::kPending:
      return to == TaskState::kStaging;
    case TaskState::kStaging:
      return to == TaskState::kChecking;
    case TaskState::kChecking:
      return to == TaskState::kPushing || to == TaskState::kSkipped;
    case TaskState::kPushing:
      return to == TaskState::kDone || to == TaskState::kRetrying;
    case TaskState::kRetrying:
      return to == TaskState::kPushing;
    default:
      return false;
  }
}

constexpr std::string_view ToString(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return "pending";
    case TaskState::kStaging:
      return "staging";
    case TaskState::kChecking:
      return "checking";
    case TaskState::kPushing:
      return "pushing";
    case TaskState::kRetrying:
      return "retrying";
    case TaskState::kDone:
      return "done";
    case TaskState::kSkipped:
      return "skipped";
    case TaskState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace migrator::model
