#include "scoring_engine.hpp"

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace datarouter::routing {

namespace {

struct Raw {
  std::string name;
  double      cost        = 0.0;
  double      latency     = 0.0;
  double      reliability = 0.0;
  double      geo         = 0.0;
};

struct Range {
  double lo = 0.0;
  double hi = 0.0;
};

template <typename Field>
Range RangeOf(const std::vector<Raw>& raws, Field field) {
  Range r{field(raws.front()), field(raws.front())};
  for (const auto& raw : raws) {
    r.lo = std::min(r.lo, field(raw));
    r.hi = std::max(r.hi, field(raw));
  }
  return r;
}

// lower_is_better decides the value used when every candidate is equal.
double Normalize(double value, const Range& range, bool lower_is_better) {
  const double spread = range.hi - range.lo;
  if (spread <= 0.0) return lower_is_better ? 0.0 : 1.0;
  return (value - range.lo) / spread;
}

model::FactorWeights BaseWeights(model::RoutingStrategy strategy) {
  switch (strategy) {
    case model::RoutingStrategy::kCostOptimized:
      return {0.7, 0.1, 0.1, 0.1};
    case model::RoutingStrategy::kLatencyOptimized:
      return {0.1, 0.7, 0.1, 0.1};
    case model::RoutingStrategy::kGeoOptimized:
      return {0.05, 0.2, 0.05, 0.7};
    case model::RoutingStrategy::kBalanced:
      break;
  }
  return {};
}

} // namespace

ScoringEngine::ScoringEngine(std::shared_ptr<metrics::BackendMetricsStore> metrics, std::shared_ptr<metrics::RegionCatalog> regions)
    : metrics_(std::move(metrics)), regions_(std::move(regions)) {
}

model::FactorWeights ScoringEngine::WeightsFor(model::RoutingStrategy strategy, model::Priority priority,
                                               const std::map<std::string, double>& custom_factors) {
  auto w = BaseWeights(strategy);

  if (priority == model::Priority::kHigh) {
    w.reliability += 0.1;
  } else if (priority == model::Priority::kCritical) {
    w.reliability += 0.2;
  }

  for (const auto& [factor, weight] : custom_factors) {
    if (factor == model::kFactorCost) {
      w.cost = weight;
    } else if (factor == model::kFactorLatency) {
      w.latency = weight;
    } else if (factor == model::kFactorReliability) {
      w.reliability = weight;
    } else if (factor == model::kFactorGeo) {
      w.geo = weight;
    } else {
      throw util::ValidationError("unknown custom factor: " + factor);
    }
  }

  const double total = w.cost + w.latency + w.reliability + w.geo;
  if (total <= 0.0) return {};
  return {w.cost / total, w.latency / total, w.reliability / total, w.geo / total};
}

std::vector<std::string> ScoringEngine::Candidates(const std::optional<model::RoutingRule>& rule) const {
  const auto available = metrics_->Names();

  if (!rule || (rule->preferred_backends.empty() && rule->excluded_backends.empty())) {
    return available;
  }

  std::set<std::string> picked;
  if (rule->preferred_backends.empty()) {
    picked.insert(available.begin(), available.end());
  } else {
    for (const auto& name : rule->preferred_backends) {
      if (std::binary_search(available.begin(), available.end(), name)) picked.insert(name);
    }
  }
  for (const auto& name : rule->excluded_backends)
    picked.erase(name);

  return {picked.begin(), picked.end()};
}

std::vector<model::BackendScore> ScoringEngine::Score(const std::vector<std::string>& candidates, const model::FactorWeights& weights,
                                                      const std::optional<model::GeoPoint>& client_location) const {
  const std::set<std::string> unique(candidates.begin(), candidates.end());
  const auto                  snapshot = metrics_->GetAll();

  std::vector<Raw>                   raws;
  std::vector<std::optional<double>> distances;
  for (const auto& name : unique) {
    auto it = snapshot.find(name);
    if (it == snapshot.end()) continue;
    const auto& m = it->second;

    Raw raw;
    raw.name        = name;
    raw.cost        = m.storage_cost_per_gb + m.retrieval_cost_per_gb;
    raw.latency     = m.avg_latency_ms;
    raw.reliability = m.success_rate * m.uptime_pct / 100.0;
    raws.push_back(std::move(raw));

    std::optional<double> distance = 0.0;
    if (client_location && !m.multi_region) {
      auto point = regions_->Locate(m);
      distance   = point ? std::optional<double>(metrics::HaversineKm(*client_location, *point)) : std::nullopt;
    }
    distances.push_back(distance);
  }

  if (raws.empty()) throw util::NoEligibleBackend("no eligible backend among candidates");

  // backends without coordinates rank as the farthest known one
  double worst = 0.0;
  for (const auto& d : distances) {
    if (d) worst = std::max(worst, *d);
  }
  for (std::size_t i = 0; i < raws.size(); ++i)
    raws[i].geo = distances[i].value_or(worst);

  const auto cost        = RangeOf(raws, [](const Raw& r) { return r.cost; });
  const auto latency     = RangeOf(raws, [](const Raw& r) { return r.latency; });
  const auto reliability = RangeOf(raws, [](const Raw& r) { return r.reliability; });
  const auto geo         = RangeOf(raws, [](const Raw& r) { return r.geo; });

  std::vector<model::BackendScore> scores;
  scores.reserve(raws.size());
  for (const auto& raw : raws) {
    model::BackendScore s;
    s.backend                = raw.name;
    s.components.cost        = Normalize(raw.cost, cost, true);
    s.components.latency     = Normalize(raw.latency, latency, true);
    s.components.reliability = Normalize(raw.reliability, reliability, false);
    s.components.geo         = Normalize(raw.geo, geo, true);
    s.score = weights.cost * (1.0 - s.components.cost) + weights.latency * (1.0 - s.components.latency) +
              weights.reliability * s.components.reliability + weights.geo * (1.0 - s.components.geo);
    scores.push_back(std::move(s));
  }

  std::sort(scores.begin(), scores.end(), [](const model::BackendScore& a, const model::BackendScore& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.backend < b.backend;
  });
  return scores;
}

} // namespace datarouter::routing
