#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/model/backend_metrics.hpp"

namespace datarouter::metrics {

/*
  Supplier of full BackendMetrics snapshots.

  The health-probing mechanism lives outside this engine; implementations
  only hand over the latest snapshot per backend.
*/
class MetricsSource {
 public:
  virtual ~MetricsSource() = default;

  virtual std::map<std::string, model::BackendMetrics> Snapshot() = 0;
};

/*
  Serves fixed profiles, typically the ones declared in configuration.
*/
class StaticMetricsSource final : public MetricsSource {
 public:
  void Set(const std::string& backend, const model::BackendMetrics& metrics);

  std::map<std::string, model::BackendMetrics> Snapshot() override;

 private:
  std::mutex                                   mutex_;
  std::map<std::string, model::BackendMetrics> profiles_;
};

} // namespace datarouter::metrics
