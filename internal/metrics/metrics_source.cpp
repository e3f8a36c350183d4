#include "metrics_source.hpp"

namespace datarouter::metrics {

void StaticMetricsSource::Set(const std::string& backend, const model::BackendMetrics& metrics) {
  std::lock_guard lock(mutex_);
  profiles_[backend] = metrics;
}

std::map<std::string, model::BackendMetrics> StaticMetricsSource::Snapshot() {
  std::lock_guard lock(mutex_);
  return profiles_;
}

} // namespace datarouter::metrics
