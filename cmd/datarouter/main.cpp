#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace obs = datarouter::observability;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

// Accepts "<config.yaml>" or "--config <config.yaml>".
std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]).rfind("--", 0) != 0) return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

struct ObservabilityGuard {
  explicit ObservabilityGuard(const datarouter::runtime::config::RuntimeConfig& config) {
    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);
    obs::InitializeLogging(config);
  }

  ~ObservabilityGuard() {
    obs::ShutdownLogging();
    obs::ShutdownMetrics();
    obs::ShutdownTracing();
  }

  ObservabilityGuard(const ObservabilityGuard&)            = delete;
  ObservabilityGuard& operator=(const ObservabilityGuard&) = delete;
};

int Run(const std::string& config_path) {
  const auto         config = datarouter::config::ConfigLoader::LoadFromYaml(config_path);
  ObservabilityGuard observability(config);

  try {
    auto app = datarouter::factory::Build(config);

    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    app.executor->Start();
    if (app.collect_periodically) app.collector->Start();

    const auto summary = app.migration_service->Summary();
    DATAROUTER_LOG_INFO("Data router started",
                        {obs::StringField("version", obs::kServiceVersion), obs::StringField("config", config_path),
                         obs::IntField("backends", static_cast<int64_t>(app.backends->Names().size())),
                         obs::IntField("tasks", summary.ok() ? static_cast<int64_t>(summary.value->total_tasks) : -1),
                         obs::BoolField("periodic_collection", app.collect_periodically)});

    while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    DATAROUTER_LOG_INFO("Stopping data router");
    app.collector->Stop();
    app.executor->Stop();
  } catch (const std::exception& e) {
    DATAROUTER_LOG_ERROR("Data router aborted", {obs::StringField("error", e.what())});
    return 2;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) == "--version") {
    std::cout << obs::kServiceName << " " << obs::kServiceVersion << std::endl;
    return 0;
  }

  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << "usage: datarouter [--config] <config.yaml> | --version" << std::endl;
    return 1;
  }

  try {
    return Run(*config_path);
  } catch (const std::exception& e) {
    // config errors surface before logging is configured
    std::cerr << "datarouter: " << e.what() << std::endl;
    return 2;
  }
}
