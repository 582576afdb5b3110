#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace migrator::transfer {

enum class GateDecision : std::uint8_t {
  kSkip     = 0,
  kTransfer = 1,
};

/*
  Decides whether an object needs to be (re)transferred.

  Skip only when both sides carry a fingerprint and they are equal. Any
  missing or uncomputable fingerprint fails open toward Transfer so that no
  object is ever silently dropped.
*/
class ChecksumGate {
 public:
  static GateDecision Decide(const std::optional<std::string>& source_fingerprint,
                             const std::optional<std::string>& destination_fingerprint);
};

constexpr std::string_view ToString(GateDecision decision) {
  return decision == GateDecision::kSkip ? "skip" : "transfer";
}

} // namespace migrator::transfer
