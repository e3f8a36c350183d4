#include "backend_metrics_store.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace datarouter::metrics {

namespace {

void RequireNonNegative(const std::string& backend, const char* field, double value) {
  if (!std::isfinite(value) || value < 0.0) {
    throw util::ValidationError("backend " + backend + ": " + field + " must be a non-negative number");
  }
}

} // namespace

void BackendMetricsStore::Validate(const std::string& backend, const model::BackendMetrics& m) {
  if (backend.empty()) {
    throw util::ValidationError("backend name must not be empty");
  }
  if (!std::isfinite(m.success_rate) || m.success_rate < 0.0 || m.success_rate > 1.0) {
    throw util::ValidationError("backend " + backend + ": success_rate must be within [0, 1]");
  }
  if (!std::isfinite(m.uptime_pct) || m.uptime_pct < 0.0 || m.uptime_pct > 100.0) {
    throw util::ValidationError("backend " + backend + ": uptime_pct must be within [0, 100]");
  }
  RequireNonNegative(backend, "avg_latency_ms", m.avg_latency_ms);
  RequireNonNegative(backend, "throughput_mbps", m.throughput_mbps);
  RequireNonNegative(backend, "storage_cost_per_gb", m.storage_cost_per_gb);
  RequireNonNegative(backend, "retrieval_cost_per_gb", m.retrieval_cost_per_gb);
  RequireNonNegative(backend, "bandwidth_cost_per_gb", m.bandwidth_cost_per_gb);

  if (m.location && !model::IsValid(*m.location)) {
    throw util::ValidationError("backend " + backend + ": coordinates out of range");
  }
}

void BackendMetricsStore::Update(const std::string& backend, model::BackendMetrics metrics) {
  Validate(backend, metrics);
  metrics.updated_at = util::Now();

  std::unique_lock lock(mutex_);
  metrics_[backend] = std::move(metrics);
}

model::BackendMetrics BackendMetricsStore::Get(const std::string& backend) const {
  std::shared_lock lock(mutex_);
  auto             it = metrics_.find(backend);
  if (it == metrics_.end()) {
    throw util::NotFound("no metrics for backend: " + backend);
  }
  return it->second;
}

std::map<std::string, model::BackendMetrics> BackendMetricsStore::GetAll() const {
  std::shared_lock lock(mutex_);
  return {metrics_.begin(), metrics_.end()};
}

bool BackendMetricsStore::Contains(const std::string& backend) const {
  std::shared_lock lock(mutex_);
  return metrics_.contains(backend);
}

std::vector<std::string> BackendMetricsStore::Names() const {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names.reserve(metrics_.size());
    for (const auto& [name, _] : metrics_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace datarouter::metrics
