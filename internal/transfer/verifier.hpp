#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/transfer_task.hpp"
#include "internal/storage/object_store.hpp"

namespace migrator::transfer {

struct VerificationReport {
  bool matched = false;

  uint64_t                source_count = 0;
  std::optional<uint64_t> destination_count;

  uint64_t skipped   = 0;
  uint64_t succeeded = 0;
  uint64_t failed    = 0;

  // destination keys whose fingerprint no longer matches what was sent
  std::vector<std::string> fingerprint_mismatches;

  // empty when matched
  std::string discrepancy;
};

/*
  Post-run reconciliation.

  matched requires

      skipped + succeeded == source_count - failed
      destination_count   == source_count
      no fingerprint mismatches (when enabled)

  Reconcile never throws; store errors are reported in discrepancy.
*/
class Verifier {
 public:
  Verifier(storage::ObjectSinkPtr sink, bool verify_fingerprints);

  // Re-queries the destination count (and fingerprints when enabled).
  VerificationReport Reconcile(uint64_t source_count, const std::vector<model::TransferResult>& results) const;

  VerificationReport Reconcile(uint64_t source_count, std::optional<uint64_t> destination_count,
                               const std::vector<model::TransferResult>& results) const;

 private:
  void CheckFingerprints(const std::vector<model::TransferResult>& results, VerificationReport& report) const;

  storage::ObjectSinkPtr sink_;
  bool                   verify_fingerprints_;
};

} // namespace migrator::transfer
