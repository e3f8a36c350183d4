#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace datarouter::runtime::config {
class RuntimeConfig;
}

namespace datarouter::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

#ifndef DATAROUTER_VERSION
#define DATAROUTER_VERSION "0.0.0"
#endif

inline constexpr const char* kServiceName    = "datarouter";
inline constexpr const char* kServiceVersion = DATAROUTER_VERSION;

struct OtlpConfig {
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
};

// Service-layer calls are kServer; executor tasks pulled from the queue are kConsumer.
enum class SpanKind {
  kInternal,
  kServer,
  kConsumer,
};

bool InitializeTracing(const datarouter::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const datarouter::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name, SpanKind kind = SpanKind::kInternal);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void SetFlag(std::string_view key, bool value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordRoutingDecision(std::string_view backend, std::string_view strategy);
  void RecordMigrationOutcome(std::string_view outcome);
  void ObserveMigrationDurationMs(double duration_ms);
  void AddMigratedBytes(std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const datarouter::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const datarouter::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view, SpanKind) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::SetFlag(std::string_view, bool) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRoutingDecision(std::string_view, std::string_view) {
}

inline void Metrics::RecordMigrationOutcome(std::string_view) {
}

inline void Metrics::ObserveMigrationDurationMs(double) {
}

inline void Metrics::AddMigratedBytes(std::uint64_t) {
}
#endif

} // namespace datarouter::observability
