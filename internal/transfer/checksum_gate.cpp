#include "checksum_gate.hpp"

#include "internal/storage/common/fingerprint.hpp"

namespace migrator::transfer {

GateDecision ChecksumGate::Decide(const std::optional<std::string>& source_fingerprint,
                                  const std::optional<std::string>& destination_fingerprint) {
  if (!source_fingerprint || !destination_fingerprint) {
    return GateDecision::kTransfer;
  }

  // both sides are compared in normalised form; a value that does not
  // normalise (multipart ETag, garbage) is not comparable
  const auto source      = storage::common::NormalizeEtag(*source_fingerprint);
  const auto destination = storage::common::NormalizeEtag(*destination_fingerprint);
  if (!source || !destination) {
    return GateDecision::kTransfer;
  }

  return *source == *destination ? GateDecision::kSkip : GateDecision::kTransfer;
}

} // namespace migrator::transfer
