#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/content.hpp"
#include "internal/util/time.hpp"

namespace datarouter::model {

/*
  Latest health/cost snapshot for one backend.

  Always replaced as a whole; there is no partial merge.
*/
struct BackendMetrics {
  double avg_latency_ms  = 0.0;
  double success_rate    = 1.0; // [0, 1]
  double throughput_mbps = 0.0;

  double storage_cost_per_gb   = 0.0;
  double retrieval_cost_per_gb = 0.0;
  double bandwidth_cost_per_gb = 0.0;

  std::uint64_t total_stored_bytes    = 0;
  std::uint64_t total_retrieved_bytes = 0;

  std::string region;
  bool        multi_region = false;
  double      uptime_pct   = 100.0; // [0, 100]

  // Explicit coordinates take precedence over the region catalog.
  std::optional<GeoPoint> location;

  util::TimePoint updated_at{};
};

} // namespace datarouter::model
