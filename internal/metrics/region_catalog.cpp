#include "region_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numbers>

#include "internal/util/errors.hpp"

namespace datarouter::metrics {

namespace {

constexpr double kEarthRadiusKm = 6371.0;

double Radians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

} // namespace

RegionCatalog::RegionCatalog()
    : regions_{
          {"us-east-1", {38.13, -78.45}},      {"us-east-2", {40.42, -83.78}},      {"us-west-1", {37.78, -122.42}},
          {"us-west-2", {45.84, -119.68}},     {"eu-west-1", {53.34, -6.27}},       {"eu-central-1", {50.11, 8.68}},
          {"ap-northeast-1", {35.69, 139.69}}, {"ap-southeast-1", {1.35, 103.82}},  {"ap-southeast-2", {-33.87, 151.21}},
          {"sa-east-1", {-23.55, -46.63}},
      } {
}

void RegionCatalog::Register(const std::string& region, model::GeoPoint point) {
  if (!model::IsValid(point)) throw util::ValidationError("region " + region + ": coordinates out of range");
  std::unique_lock lock(mutex_);
  regions_[region] = point;
}

std::optional<model::GeoPoint> RegionCatalog::Lookup(const std::string& region) const {
  std::shared_lock lock(mutex_);
  auto             it = regions_.find(region);
  if (it == regions_.end()) return std::nullopt;
  return it->second;
}

std::optional<model::GeoPoint> RegionCatalog::Locate(const model::BackendMetrics& metrics) const {
  if (metrics.location) return metrics.location;
  if (metrics.region.empty()) return std::nullopt;
  return Lookup(metrics.region);
}

double HaversineKm(const model::GeoPoint& a, const model::GeoPoint& b) {
  const double dlat = Radians(b.latitude - a.latitude);
  const double dlon = Radians(b.longitude - a.longitude);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(Radians(a.latitude)) * std::cos(Radians(b.latitude)) * std::sin(dlon / 2) * std::sin(dlon / 2);

  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

} // namespace datarouter::metrics
