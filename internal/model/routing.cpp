#include "routing.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace datarouter::model {

RoutingStrategy ParseStrategy(std::string_view value) {
  for (auto strategy : {RoutingStrategy::kBalanced, RoutingStrategy::kCostOptimized, RoutingStrategy::kLatencyOptimized,
                        RoutingStrategy::kGeoOptimized}) {
    if (ToString(strategy) == value) {
      return strategy;
    }
  }
  throw util::ValidationError("unknown routing strategy: " + std::string(value));
}

RoutingStrategy StrategyFromInt(std::int64_t value) {
  if (value < 0 || value > static_cast<std::int64_t>(RoutingStrategy::kGeoOptimized)) {
    throw util::ValidationError("routing strategy out of range: " + std::to_string(value));
  }
  return static_cast<RoutingStrategy>(value);
}

bool IsKnownFactor(std::string_view name) {
  return name == kFactorCost || name == kFactorLatency || name == kFactorReliability || name == kFactorGeo;
}

} // namespace datarouter::model
