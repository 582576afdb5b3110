#include "verifier.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/transfer/checksum_gate.hpp"

namespace migrator::transfer {

using migrator::model::Outcome;
using migrator::observability::IntField;
using migrator::observability::StringField;

namespace {

void Append(std::string& discrepancy, const std::string& text) {
  if (!discrepancy.empty()) discrepancy += "; ";
  discrepancy += text;
}

} // namespace

Verifier::Verifier(storage::ObjectSinkPtr sink, bool verify_fingerprints) : sink_(std::move(sink)), verify_fingerprints_(verify_fingerprints) {
}

VerificationReport Verifier::Reconcile(uint64_t source_count, const std::vector<model::TransferResult>& results) const {
  std::optional<uint64_t> destination_count;
  std::string             count_error;
  try {
    destination_count = sink_->Count();
  } catch (const std::exception& e) {
    count_error = std::string("destination count unavailable: ") + e.what();
  }

  auto report = Reconcile(source_count, destination_count, results);
  if (!count_error.empty()) {
    Append(report.discrepancy, count_error);
  }

  if (verify_fingerprints_) {
    CheckFingerprints(results, report);
  }

  MIGRATOR_LOG_INFO("Total objects in source", {IntField("count", report.source_count)});
  if (report.destination_count) {
    MIGRATOR_LOG_INFO("Total objects in destination", {IntField("count", *report.destination_count)});
  }
  if (report.matched) {
    MIGRATOR_LOG_INFO("Object count matches. Transfer verified");
  } else {
    MIGRATOR_LOG_WARN("Object count mismatch", {StringField("discrepancy", report.discrepancy)});
  }
  return report;
}

VerificationReport Verifier::Reconcile(uint64_t source_count, std::optional<uint64_t> destination_count,
                                       const std::vector<model::TransferResult>& results) const {
  VerificationReport report;
  report.source_count      = source_count;
  report.destination_count = destination_count;

  for (const auto& result : results) {
    switch (result.outcome) {
      case Outcome::kSkipped:
        ++report.skipped;
        break;
      case Outcome::kSucceeded:
        ++report.succeeded;
        break;
      case Outcome::kFailed:
        ++report.failed;
        break;
    }
  }

  const uint64_t accounted = report.skipped + report.succeeded;
  if (report.failed > source_count || accounted != source_count - report.failed) {
    std::ostringstream out;
    out << "results account for " << accounted << " of " << source_count << " source objects with " << report.failed << " failed";
    Append(report.discrepancy, out.str());
  }

  if (!destination_count) {
    Append(report.discrepancy, "destination count unknown");
  } else if (*destination_count != source_count) {
    std::ostringstream out;
    out << "destination holds " << *destination_count << " objects, source holds " << source_count;
    Append(report.discrepancy, out.str());
  }

  report.matched = report.discrepancy.empty();
  return report;
}

void Verifier::CheckFingerprints(const std::vector<model::TransferResult>& results, VerificationReport& report) const {
  for (const auto& result : results) {
    if (result.outcome == Outcome::kFailed || !result.source_fingerprint) {
      continue;
    }

    try {
      const auto head = sink_->Head(result.destination_key);
      if (!head) {
        report.fingerprint_mismatches.push_back(result.destination_key);
        continue;
      }
      // not comparable (multipart ETag) is not a mismatch
      if (!head->fingerprint) {
        continue;
      }
      if (ChecksumGate::Decide(result.source_fingerprint, head->fingerprint) != GateDecision::kSkip) {
        report.fingerprint_mismatches.push_back(result.destination_key);
      }
    } catch (const std::exception& e) {
      Append(report.discrepancy, "fingerprint check failed for " + result.destination_key + ": " + e.what());
    }
  }

  if (!report.fingerprint_mismatches.empty()) {
    Append(report.discrepancy, std::to_string(report.fingerprint_mismatches.size()) + " destination objects differ from source");
    for (const auto& key : report.fingerprint_mismatches) {
      MIGRATOR_LOG_WARN("Fingerprint mismatch", {StringField("key", key)});
    }
  }
  report.matched = report.discrepancy.empty();
}

} // namespace migrator::transfer
