#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace datarouter::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

std::mutex                                          g_tracer_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> BuildProcessor(const datarouter::runtime::config::ObservabilityConfig::TracingConfig& tracing,
                                                        std::unique_ptr<sdktrace::SpanExporter>                             exporter) {
  if (tracing.simple_processor()) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  sdktrace::BatchSpanProcessorOptions batch_options;
  if (tracing.max_queue_size() > 0) {
    batch_options.max_queue_size = tracing.max_queue_size();
  }
  if (tracing.schedule_delay_ms() > 0) {
    batch_options.schedule_delay_millis = std::chrono::milliseconds(tracing.schedule_delay_ms());
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), batch_options);
}

// Falls back to whatever global provider is installed (noop by default).
opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  std::lock_guard lock(g_tracer_mutex);
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kServiceName, kServiceVersion);
    }
  }
  return g_tracer;
}

trace_api::SpanKind ToOtel(SpanKind kind) {
  switch (kind) {
    case SpanKind::kServer:
      return trace_api::SpanKind::kServer;
    case SpanKind::kConsumer:
      return trace_api::SpanKind::kConsumer;
    case SpanKind::kInternal:
      break;
  }
  return trace_api::SpanKind::kInternal;
}

} // namespace

bool InitializeTracing(const datarouter::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == datarouter::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const resource::ResourceAttributes attrs = {{"service.name", kServiceName}, {"service.version", kServiceVersion}};

  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(BuildProcessor(observability.tracing(), BuildExporter(otlp_config)), resource::Resource::Create(attrs));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::lock_guard lock(g_tracer_mutex);
  g_sdk_provider = std::move(provider);
  g_tracer       = g_sdk_provider->GetTracer(kServiceName, kServiceVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard lock(g_tracer_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool Active() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name, SpanKind kind) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  options.kind = ToOtel(kind);
  impl_->span  = tracer->StartSpan(std::string(name), options);
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->Active()) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->Active()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->Active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->Active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetFlag(std::string_view key, bool value) {
  if (impl_ && impl_->Active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->Active()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->Active()) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace datarouter::observability

#endif
