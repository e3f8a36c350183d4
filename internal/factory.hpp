#pragma once

#include <functional>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/metrics/backend_metrics_store.hpp"
#include "internal/metrics/metrics_collector.hpp"
#include "internal/metrics/region_catalog.hpp"
#include "internal/migration/migration_controller.hpp"
#include "internal/migration/migration_executor.hpp"
#include "internal/routing/data_router.hpp"
#include "internal/routing/rule_engine.hpp"
#include "internal/service/migration_service.hpp"
#include "internal/service/routing_service.hpp"
#include "internal/storage/backend_registry.hpp"

namespace datarouter::factory {

/*
  Application

  Owns all long-lived components used by the daemon.
  Background threads are not started here; see Start/Stop in main.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<storage::BackendRegistry> backends;

  std::shared_ptr<metrics::RegionCatalog>       regions;
  std::shared_ptr<metrics::BackendMetricsStore> metrics;
  std::shared_ptr<metrics::MetricsCollector>    collector;
  bool                                          collect_periodically = false;

  std::shared_ptr<routing::RuleEngine> rules;
  std::shared_ptr<routing::DataRouter> router;
  routing::RouterDefaults              router_defaults;

  std::shared_ptr<migration::MigrationController> migrations;
  std::shared_ptr<migration::MigrationExecutor>   executor;
  migration::RetryPolicy                          retry;
  migration::ExecutorOptions                      executor_options;

  std::shared_ptr<service::RoutingService>   routing_service;
  std::shared_ptr<service::MigrationService> migration_service;
};

// Creates the store for one configured backend.
using StoreFactory = std::function<storage::BackendStorePtr(const datarouter::runtime::config::BackendConfig&)>;

// Arrow RAM or disk store; throws when Arrow storage is not compiled in.
storage::BackendStorePtr BuildArrowStore(const datarouter::runtime::config::BackendConfig& backend);

/*
  Build

  Composition root. The only place that knows concrete repository and
  backend store types. Unset configuration values resolve to the
  defaults: 4 workers, 3 retries, 1000 ms base backoff, 200 ms poll,
  balanced strategy and normal priority.
*/
Application Build(const datarouter::runtime::config::RuntimeConfig& config, const StoreFactory& make_store = BuildArrowStore);

std::shared_ptr<db::Repository> BuildRepository(const datarouter::runtime::config::RuntimeConfig& config);

model::BackendMetrics ToBackendMetrics(const datarouter::runtime::config::BackendProfile& profile);

} // namespace datarouter::factory
