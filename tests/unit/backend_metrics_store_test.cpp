#include "internal/metrics/backend_metrics_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/metrics/metrics_collector.hpp"
#include "internal/metrics/metrics_source.hpp"
#include "internal/metrics/region_catalog.hpp"
#include "internal/util/errors.hpp"

namespace {

using datarouter::metrics::BackendMetricsStore;
using datarouter::model::BackendMetrics;

BackendMetrics Metrics(double latency, double cost) {
  BackendMetrics m;
  m.avg_latency_ms      = latency;
  m.storage_cost_per_gb = cost;
  m.region              = "us-east-1";
  return m;
}

void TestUpdateReplacesWholeSnapshot() {
  BackendMetricsStore store;

  auto first            = Metrics(10, 0.02);
  first.throughput_mbps = 500;
  store.Update("s3", first);

  store.Update("s3", Metrics(20, 0.03));

  const auto got = store.Get("s3");
  assert(got.avg_latency_ms == 20);
  assert(got.storage_cost_per_gb == 0.03);
  assert(got.throughput_mbps == 0.0);
}

void TestUnknownBackendIsNotFound() {
  BackendMetricsStore store;
  bool                threw = false;
  try {
    (void)store.Get("missing");
  } catch (const datarouter::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Contains("missing"));
}

void TestInvalidSnapshotsAreRejected() {
  BackendMetricsStore store;

  auto bad         = Metrics(10, 0.01);
  bad.success_rate = 1.5;
  bool threw       = false;
  try {
    store.Update("a", bad);
  } catch (const datarouter::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  bad   = Metrics(std::numeric_limits<double>::quiet_NaN(), 0.01);
  threw = false;
  try {
    store.Update("a", bad);
  } catch (const datarouter::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  for (const auto point : {datarouter::model::GeoPoint{std::numeric_limits<double>::quiet_NaN(), 0.0},
                           datarouter::model::GeoPoint{0.0, std::numeric_limits<double>::infinity()},
                           datarouter::model::GeoPoint{90.5, 0.0}}) {
    bad          = Metrics(10, 0.01);
    bad.location = point;
    threw        = false;
    try {
      store.Update("c", bad);
    } catch (const datarouter::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(store.GetAll().empty());
}

void TestGetAllAndNamesAreSorted() {
  BackendMetricsStore store;
  store.Update("ipfs", Metrics(80, 0.0));
  store.Update("filecoin", Metrics(500, 0.001));
  store.Update("s3", Metrics(20, 0.023));

  const auto names = store.Names();
  assert((names == std::vector<std::string>{"filecoin", "ipfs", "s3"}));

  const auto all = store.GetAll();
  assert(all.size() == 3);
  assert(all.begin()->first == "filecoin");
}

// Writers keep latency == cost * 1000; a torn read would break it.
void TestConcurrentReadersSeeWholeSnapshots() {
  BackendMetricsStore store;
  store.Update("b", Metrics(1000, 1.0));

  std::atomic<bool> stop{false};
  std::atomic<int>  torn{0};

  std::vector<std::thread> threads;
  for (int w = 0; w < 2; ++w) {
    threads.emplace_back([&, w] {
      for (int i = 1; i <= 2000; ++i) {
        const double cost = static_cast<double>(i + w * 10000);
        store.Update("b", Metrics(cost * 1000, cost));
      }
    });
  }
  for (int r = 0; r < 4; ++r) {
    threads.emplace_back([&] {
      while (!stop) {
        const auto m = store.Get("b");
        if (m.avg_latency_ms != m.storage_cost_per_gb * 1000) ++torn;
        for (const auto& [_, snapshot] : store.GetAll()) {
          if (snapshot.avg_latency_ms != snapshot.storage_cost_per_gb * 1000) ++torn;
        }
      }
    });
  }

  threads[0].join();
  threads[1].join();
  stop = true;
  for (std::size_t i = 2; i < threads.size(); ++i)
    threads[i].join();

  assert(torn == 0);
}

void TestCollectorSkipsInvalidProfiles() {
  auto source = std::make_shared<datarouter::metrics::StaticMetricsSource>();
  auto store  = std::make_shared<BackendMetricsStore>();

  auto bad       = Metrics(10, 0.01);
  bad.uptime_pct = 120;
  source->Set("good", Metrics(10, 0.01));
  source->Set("bad", bad);

  datarouter::metrics::MetricsCollector collector(source, store, std::chrono::milliseconds(10));
  const auto                            accepted = collector.Collect();
  assert(accepted.size() == 1);
  assert(accepted.count("good") == 1);
  assert(store->Contains("good"));
  assert(!store->Contains("bad"));
}

void TestRegionCatalogLocatesBackends() {
  datarouter::metrics::RegionCatalog catalog;
  auto                               m = Metrics(10, 0.01);
  assert(catalog.Locate(m).has_value());

  m.region = "mars-north-1";
  assert(!catalog.Locate(m).has_value());

  catalog.Register("mars-north-1", {10.0, 20.0});
  assert(catalog.Locate(m)->latitude == 10.0);

  bool threw = false;
  try {
    catalog.Register("venus-1", {std::numeric_limits<double>::quiet_NaN(), 0.0});
  } catch (const datarouter::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  m.location = datarouter::model::GeoPoint{1.0, 2.0};
  assert(catalog.Locate(m)->longitude == 2.0);

  // New York to London is about 5570 km
  const double km = datarouter::metrics::HaversineKm({40.7128, -74.0060}, {51.5074, -0.1278});
  assert(km > 5500 && km < 5650);
}

} // namespace

int main() {
  TestUpdateReplacesWholeSnapshot();
  TestUnknownBackendIsNotFound();
  TestInvalidSnapshotsAreRejected();
  TestGetAllAndNamesAreSorted();
  TestConcurrentReadersSeeWholeSnapshots();
  TestCollectorSkipsInvalidProfiles();
  TestRegionCatalogLocatesBackends();

  std::cout << "datarouter_unit_backend_metrics_store: pass\n";
  return 0;
}
