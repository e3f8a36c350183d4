#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace datarouter::observability {
namespace {

constexpr const char* kLoggerName     = "datarouter";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// env beats config beats fallback
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) return value;
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const datarouter::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("DATAROUTER_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

// Values with spaces, quotes or '=' are quoted so lines stay splittable on whitespace.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\n\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out += c;
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const datarouter::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Resolve("DATAROUTER_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));

  // spdlog maps unknown names to "off"; a typo must not silence the daemon
  const auto level_name = Resolve("DATAROUTER_LOG_LEVEL", config.logging().level(), "info");
  auto       level      = spdlog::level::from_str(level_name);
  const bool unknown    = level == spdlog::level::off && level_name != "off";
  if (unknown) level = spdlog::level::info;
  logger->set_level(level);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (unknown) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace datarouter::observability
