#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace migrator::runtime::config {
class RuntimeConfig;
}

namespace migrator::observability {

/*
  Installs the OTLP trace and metric pipelines the config enables, with the
  run's source container and destination bucket as resource attributes.
  Returns false when neither signal is enabled.
*/
bool InitializeTelemetry(const migrator::runtime::config::RuntimeConfig& config);
void ShutdownTelemetry();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide transfer instruments:

    migrator.transfer.count{outcome}
    migrator.transfer.bytes
    migrator.transfer.duration_ms{outcome}
    migrator.transfer.retries{stage}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTransfer(std::string_view outcome, std::uint64_t bytes);
  void ObserveTransferDurationMs(std::string_view outcome, double duration_ms);
  void RecordRetry(std::string_view stage);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTelemetry(const migrator::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTelemetry() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTransfer(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveTransferDurationMs(std::string_view, double) {
}

inline void Metrics::RecordRetry(std::string_view) {
}
#endif

} // namespace migrator::observability
