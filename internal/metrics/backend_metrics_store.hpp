#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/backend_metrics.hpp"

namespace datarouter::metrics {

/*
  Current-state cache of BackendMetrics keyed by backend name.

  Thread safety:
    - shared reads
    - exclusive writes

  Update replaces the whole snapshot (last write wins). No history is kept.
*/
class BackendMetricsStore {
 public:
  // Throws util::ValidationError on out-of-range fields.
  void Update(const std::string& backend, model::BackendMetrics metrics);

  // Throws util::NotFound for unknown backends.
  model::BackendMetrics Get(const std::string& backend) const;

  // Consistent copy taken under a single read lock.
  std::map<std::string, model::BackendMetrics> GetAll() const;

  bool                     Contains(const std::string& backend) const;
  std::vector<std::string> Names() const;

  static void Validate(const std::string& backend, const model::BackendMetrics& metrics);

 private:
  mutable std::shared_mutex                              mutex_;
  std::unordered_map<std::string, model::BackendMetrics> metrics_;
};

} // namespace datarouter::metrics
