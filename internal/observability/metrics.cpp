#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define DATAROUTER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define DATAROUTER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace datarouter::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

template <typename T>
using Handle = opentelemetry::nostd::shared_ptr<T>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Instrument groups that can be switched off from config.
bool g_request_metrics   = true;
bool g_migration_metrics = true;
bool g_route_labels      = true;

std::string MetricsEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  for (const char* variable : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(variable)) return value;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildMetricExporter(const OtlpConfig& config) {
  const auto endpoint = MetricsEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// The SDK changed AddMetricReader and the instrument signatures between releases.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

void Increment(const Handle<metrics_api::Counter<std::uint64_t>>& counter, std::uint64_t value, Attributes attributes) {
  if (!counter) return;
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

void Sample(const Handle<metrics_api::Histogram<double>>& histogram, double value, Attributes attributes) {
  if (!histogram) return;
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  Handle<metrics_api::Meter> meter;

  Handle<metrics_api::Counter<std::uint64_t>> operations;
  Handle<metrics_api::Histogram<double>>      operation_latency;
  Handle<metrics_api::Counter<std::uint64_t>> routing_decisions;
  Handle<metrics_api::Counter<std::uint64_t>> migration_outcomes;
  Handle<metrics_api::Histogram<double>>      migration_duration;
  Handle<metrics_api::Counter<std::uint64_t>> migrated_bytes;
};

bool InitializeMetrics(const datarouter::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  if (observability.transport() == datarouter::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp_config.transport = OtlpTransport::kHttpProtobuf;
  }

  const auto& settings    = observability.metrics();
  const auto  interval_ms = settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : 1000;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  if (settings.export_timeout_ms() > 0) {
    // the SDK rejects a timeout longer than the interval
    reader_options.export_timeout_millis = std::chrono::milliseconds(std::min(settings.export_timeout_ms(), interval_ms));
  }

#ifdef DATAROUTER_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildMetricExporter(otlp_config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildMetricExporter(otlp_config), reader_options);
#endif

  const resource::ResourceAttributes attrs = {{"service.name", kServiceName}, {"service.version", kServiceVersion}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(Handle<metrics_api::MeterProvider>(g_provider));

  g_request_metrics   = !settings.disable_request_metrics();
  g_migration_metrics = !settings.disable_migration_metrics();
  g_route_labels      = !settings.disable_route_labels();
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, kServiceVersion);
  auto& meter  = *impl_->meter;

  impl_->operations         = meter.CreateUInt64Counter("datarouter.operations", "1", "Service operations by route and outcome");
  impl_->operation_latency  = meter.CreateDoubleHistogram("datarouter.operation.latency", "ms", "Service operation latency");
  impl_->routing_decisions  = meter.CreateUInt64Counter("datarouter.routing.decisions", "1", "Routing decisions by selected backend");
  impl_->migration_outcomes = meter.CreateUInt64Counter("datarouter.migration.outcomes", "1", "Processed migration tasks by outcome");
  impl_->migration_duration = meter.CreateDoubleHistogram("datarouter.migration.duration", "ms", "Time spent processing one migration task");
  impl_->migrated_bytes     = meter.CreateUInt64Counter("datarouter.migration.bytes", "By", "Bytes written to destination backends");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_request_metrics) return;
  if (g_route_labels) {
    Increment(impl_->operations, 1, {{"route", std::string(route)}, {"success", success}});
  } else {
    Increment(impl_->operations, 1, {{"success", success}});
  }
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_request_metrics) return;
  if (g_route_labels) {
    Sample(impl_->operation_latency, latency_ms, {{"route", std::string(route)}});
  } else {
    Sample(impl_->operation_latency, latency_ms, {});
  }
}

void Metrics::RecordRoutingDecision(std::string_view backend, std::string_view strategy) {
  if (!g_request_metrics) return;
  Increment(impl_->routing_decisions, 1, {{"backend", std::string(backend)}, {"strategy", std::string(strategy)}});
}

void Metrics::RecordMigrationOutcome(std::string_view outcome) {
  if (g_migration_metrics) Increment(impl_->migration_outcomes, 1, {{"outcome", std::string(outcome)}});
}

void Metrics::ObserveMigrationDurationMs(double duration_ms) {
  if (g_migration_metrics) Sample(impl_->migration_duration, duration_ms, {});
}

void Metrics::AddMigratedBytes(std::uint64_t bytes) {
  if (g_migration_metrics) Increment(impl_->migrated_bytes, bytes, {});
}

} // namespace datarouter::observability

#endif
