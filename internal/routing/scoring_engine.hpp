#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/metrics/backend_metrics_store.hpp"
#include "internal/metrics/region_catalog.hpp"
#include "internal/model/routing.hpp"

namespace datarouter::routing {

/*
  Ranks candidate backends for one routing call.

  Raw factors per candidate, min-max normalized across the candidate set:

    cost         storage + retrieval cost per GB   lower is better
    latency      avg_latency_ms                    lower is better
    reliability  success_rate * uptime_pct / 100   higher is better
    geo          haversine km to the client        lower is better

  score = w.cost*(1-cost) + w.latency*(1-latency) + w.reliability*reliability + w.geo*(1-geo)

  A factor with zero spread normalizes to its best value. Ranking is
  score desc, then backend name asc.
*/
class ScoringEngine {
 public:
  ScoringEngine(std::shared_ptr<metrics::BackendMetricsStore> metrics, std::shared_ptr<metrics::RegionCatalog> regions);

  // Strategy weights, priority adjustment, then custom overrides, summing to 1.
  static model::FactorWeights WeightsFor(model::RoutingStrategy strategy, model::Priority priority,
                                         const std::map<std::string, double>& custom_factors);

  /*
    Candidate set for a matched rule (or none):

      preferred ∩ available, minus excluded   when the rule lists either
      every backend with metrics              otherwise

    Sorted, duplicates removed.
  */
  std::vector<std::string> Candidates(const std::optional<model::RoutingRule>& rule) const;

  // Throws util::NoEligibleBackend when no candidate has metrics.
  std::vector<model::BackendScore> Score(const std::vector<std::string>& candidates, const model::FactorWeights& weights,
                                         const std::optional<model::GeoPoint>& client_location) const;

 private:
  std::shared_ptr<metrics::BackendMetricsStore> metrics_;
  std::shared_ptr<metrics::RegionCatalog>       regions_;
};

} // namespace datarouter::routing
