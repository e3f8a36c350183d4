#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/content.hpp"
#include "internal/model/priority.hpp"
#include "internal/util/time.hpp"

namespace datarouter::model {

enum class RoutingStrategy : std::uint8_t {
  kBalanced = 0,
  kCostOptimized,
  kLatencyOptimized,
  kGeoOptimized,
};

constexpr bool IsValid(RoutingStrategy strategy) {
  return static_cast<std::uint8_t>(strategy) <= static_cast<std::uint8_t>(RoutingStrategy::kGeoOptimized);
}

constexpr std::string_view ToString(RoutingStrategy strategy) {
  switch (strategy) {
    case RoutingStrategy::kBalanced:
      return "balanced";
    case RoutingStrategy::kCostOptimized:
      return "cost_optimized";
    case RoutingStrategy::kLatencyOptimized:
      return "latency_optimized";
    case RoutingStrategy::kGeoOptimized:
      return "geo_optimized";
  }
  return "invalid";
}

// Throws util::ValidationError on anything outside the enum set.
RoutingStrategy ParseStrategy(std::string_view value);
RoutingStrategy StrategyFromInt(std::int64_t value);

// Keys accepted in RoutingRule::custom_factors.
inline constexpr std::string_view kFactorCost        = "cost";
inline constexpr std::string_view kFactorLatency     = "latency";
inline constexpr std::string_view kFactorReliability = "reliability";
inline constexpr std::string_view kFactorGeo         = "geo";

bool IsKnownFactor(std::string_view name);

struct RoutingRule {
  std::string id;
  std::string name;

  std::vector<ContentCategory> content_categories; // empty = any category
  std::vector<std::string>     content_patterns;   // glob or substring on filename

  std::optional<std::uint64_t> min_size_bytes;
  std::optional<std::uint64_t> max_size_bytes;

  std::vector<std::string> preferred_backends;
  std::vector<std::string> excluded_backends;

  Priority                      priority = Priority::kNormal;
  RoutingStrategy               strategy = RoutingStrategy::kBalanced;
  std::map<std::string, double> custom_factors;

  bool wildcard = false;
  bool active   = true;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

struct ScoreComponents {
  double cost        = 0.0;
  double latency     = 0.0;
  double reliability = 0.0;
  double geo         = 0.0;
};

struct FactorWeights {
  double cost        = 0.25;
  double latency     = 0.25;
  double reliability = 0.25;
  double geo         = 0.25;
};

struct BackendScore {
  std::string backend;
  double      score = 0.0;
  // normalized factors in [0,1]; cost/latency/geo lower-is-better
  ScoreComponents components;
};

struct RoutingDecision {
  std::string                selected_backend;
  std::optional<std::string> matched_rule_id;
  RoutingStrategy            strategy = RoutingStrategy::kBalanced;
  Priority                   priority = Priority::kNormal;
  FactorWeights              weights;
  std::vector<BackendScore>  scores; // ranked, best first
  ContentDescriptor          content;
  bool                       backend_override = false;
};

} // namespace datarouter::model
