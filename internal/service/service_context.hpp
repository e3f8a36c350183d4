#pragma once

#include <memory>

namespace datarouter::metrics {
class BackendMetricsStore;
class MetricsCollector;
} // namespace datarouter::metrics
namespace datarouter::routing {
class RuleEngine;
class DataRouter;
} // namespace datarouter::routing
namespace datarouter::migration {
class MigrationController;
class MigrationExecutor;
} // namespace datarouter::migration

namespace datarouter::service {

/*
  Dependency container shared by all services.
  collector and executor may be null when not running in this process.
*/
struct ServiceContext {
  std::shared_ptr<metrics::BackendMetricsStore>   metrics;
  std::shared_ptr<metrics::MetricsCollector>      collector;
  std::shared_ptr<routing::RuleEngine>            rules;
  std::shared_ptr<routing::DataRouter>            router;
  std::shared_ptr<migration::MigrationController> migrations;
  std::shared_ptr<migration::MigrationExecutor>   executor;
};

} // namespace datarouter::service
