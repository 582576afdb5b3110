#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace migrator::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace trace_api   = opentelemetry::trace;
namespace metrics_api = opentelemetry::metrics;
namespace sdktrace    = opentelemetry::sdk::trace;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using migrator::runtime::config::ObservabilityConfig;
using migrator::runtime::config::RuntimeConfig;

namespace {
constexpr const char* kInstrumentationName    = "object-migrator";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_tracer_provider;
std::shared_ptr<sdkmetrics::MeterProvider>          g_meter_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == migrator::runtime::config::OTLP_TRANSPORT_HTTP;
}

// Config wins, then the signal specific OTEL variable, then the shared one.
std::string Endpoint(const ObservabilityConfig& config, const char* signal_env, const char* http_path) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* value = std::getenv(signal_env)) return value;
  if (const char* value = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return value;
  return UsesHttp(config) ? std::string("http://localhost:4318") + http_path : "localhost:4317";
}

resource::Resource RunResource(const RuntimeConfig& config) {
  return resource::Resource::Create({
      {"service.name", kInstrumentationName},
      {"migrator.source.container", config.source().container()},
      {"migrator.destination.bucket", config.destination().bucket()},
      {"migrator.destination.region", config.destination().region()},
      {"migrator.workers", static_cast<int64_t>(config.transfer().max_workers())},
  });
}

void StartTracing(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  const auto  endpoint      = Endpoint(observability, "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (UsesHttp(observability)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  auto processor    = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  g_tracer_provider = sdktrace::TracerProviderFactory::Create(std::move(processor), RunResource(config));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
  g_tracer = g_tracer_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

void StartMetrics(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  const auto  endpoint      = Endpoint(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (UsesHttp(observability)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto interval_ms = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);

  g_meter_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), RunResource(config));
  g_meter_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
}

} // namespace

bool InitializeTelemetry(const RuntimeConfig& config) {
  ShutdownTelemetry();
  const auto& observability = config.observability();
  if (observability.tracing_enabled()) StartTracing(config);
  if (observability.metrics_enabled()) StartMetrics(config);
  return observability.tracing_enabled() || observability.metrics_enabled();
}

void ShutdownTelemetry() {
  if (g_tracer_provider) {
    g_tracer_provider->ForceFlush();
    g_tracer_provider->Shutdown();
    g_tracer_provider.reset();
  }
  if (g_meter_provider) {
    g_meter_provider->ForceFlush();
    g_meter_provider->Shutdown();
    g_meter_provider.reset();
  }
  g_tracer = nullptr;
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool active() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->active()) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->active()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->active()) impl_->span->AddEvent(std::string(name));
}

// A failed task marks its span as errored; the message is the migration error text.
void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->active()) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

// ------------------------------------------------------------------
// Transfer instruments
// ------------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> objects;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retries;
};

// Instruments bind to whichever meter provider is global when first used.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->objects     = meter->CreateUInt64Counter("migrator.transfer.count", "Objects processed by outcome", "1");
  impl_->bytes       = meter->CreateUInt64Counter("migrator.transfer.bytes", "Bytes pushed to the destination", "By");
  impl_->duration_ms = meter->CreateDoubleHistogram("migrator.transfer.duration_ms", "Per-object transfer duration", "ms");
  impl_->retries     = meter->CreateUInt64Counter("migrator.transfer.retries", "Retried stage or push attempts", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTransfer(std::string_view outcome, std::uint64_t bytes) {
  impl_->objects->Add(1, {{"outcome", std::string(outcome)}});
  if (bytes > 0) impl_->bytes->Add(bytes);
}

void Metrics::ObserveTransferDurationMs(std::string_view outcome, double duration_ms) {
  impl_->duration_ms->Record(duration_ms, {{"outcome", std::string(outcome)}}, opentelemetry::context::Context{});
}

void Metrics::RecordRetry(std::string_view stage) {
  impl_->retries->Add(1, {{"stage", std::string(stage)}});
}

} // namespace migrator::observability

#endif
