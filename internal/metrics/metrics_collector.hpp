#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/metrics/backend_metrics_store.hpp"
#include "internal/metrics/metrics_source.hpp"

namespace datarouter::metrics {

/*
  Pulls snapshots from a MetricsSource into the BackendMetricsStore.

  Collect() runs one pass on demand; Start() runs passes periodically on a
  background thread until Stop().
*/
class MetricsCollector {
 public:
  MetricsCollector(std::shared_ptr<MetricsSource> source, std::shared_ptr<BackendMetricsStore> store, std::chrono::milliseconds interval);
  ~MetricsCollector();

  MetricsCollector(const MetricsCollector&)            = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Returns the snapshots accepted by the store. Invalid entries are
  // skipped and logged; they do not abort the pass.
  std::map<std::string, model::BackendMetrics> Collect();

  void Start();
  void Stop();
  bool Running() const {
    return running_;
  }

 private:
  void Loop();

  std::shared_ptr<MetricsSource>       source_;
  std::shared_ptr<BackendMetricsStore> store_;
  std::chrono::milliseconds            interval_;

  std::mutex              wait_mutex_;
  std::condition_variable wake_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace datarouter::metrics
