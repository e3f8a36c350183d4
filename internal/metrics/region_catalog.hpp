#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/backend_metrics.hpp"
#include "internal/model/content.hpp"

namespace datarouter::metrics {

/*
  Region id -> coordinates.

  Seeded with the common cloud regions; operators can add or override
  entries from configuration.
*/
class RegionCatalog {
 public:
  RegionCatalog();

  void                           Register(const std::string& region, model::GeoPoint point);
  std::optional<model::GeoPoint> Lookup(const std::string& region) const;

  // Explicit coordinates first, then region lookup.
  std::optional<model::GeoPoint> Locate(const model::BackendMetrics& metrics) const;

 private:
  mutable std::shared_mutex                        mutex_;
  std::unordered_map<std::string, model::GeoPoint> regions_;
};

// Great-circle distance in kilometres.
double HaversineKm(const model::GeoPoint& a, const model::GeoPoint& b);

} // namespace datarouter::metrics
