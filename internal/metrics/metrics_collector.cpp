#include "metrics_collector.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datarouter::metrics {

using observability::StringField;

MetricsCollector::MetricsCollector(std::shared_ptr<MetricsSource> source, std::shared_ptr<BackendMetricsStore> store,
                                   std::chrono::milliseconds interval)
    : source_(std::move(source)), store_(std::move(store)), interval_(interval) {
}

MetricsCollector::~MetricsCollector() {
  Stop();
}

std::map<std::string, model::BackendMetrics> MetricsCollector::Collect() {
  std::map<std::string, model::BackendMetrics> accepted;

  for (auto& [backend, metrics] : source_->Snapshot()) {
    try {
      store_->Update(backend, metrics);
      accepted.emplace(backend, store_->Get(backend));
      DATAROUTER_LOG_DEBUG("Backend metrics collected", {StringField("backend", backend), observability::DoubleField("latency_ms", metrics.avg_latency_ms),
                                                         observability::DoubleField("success_rate", metrics.success_rate)});
    } catch (const util::ValidationError& e) {
      DATAROUTER_LOG_WARN("Rejected backend metrics snapshot", {StringField("backend", backend), StringField("error", e.what())});
    }
  }
  return accepted;
}

void MetricsCollector::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&MetricsCollector::Loop, this);
  DATAROUTER_LOG_INFO("Metrics collector started", {observability::IntField("interval_ms", interval_.count())});
}

void MetricsCollector::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
  DATAROUTER_LOG_INFO("Metrics collector stopped");
}

void MetricsCollector::Loop() {
  while (running_) {
    try {
      Collect();
    } catch (const std::exception& e) {
      DATAROUTER_LOG_ERROR("Metrics collection failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace datarouter::metrics
