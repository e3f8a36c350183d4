#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/fake_backend_store.hpp"
#if DATAROUTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using datarouter::config::ConfigLoader;
using datarouter::factory::Application;
using datarouter::model::Priority;
using datarouter::model::RoutingStrategy;
using datarouter::testing::FakeBackendStore;

// Records every store the composition root asks for.
struct StoreRecorder {
  std::vector<std::shared_ptr<FakeBackendStore>> created;

  datarouter::factory::StoreFactory Factory() {
    return [this](const datarouter::runtime::config::BackendConfig& backend) -> datarouter::storage::BackendStorePtr {
      created.push_back(std::make_shared<FakeBackendStore>(backend.name()));
      return created.back();
    };
  }
};

constexpr const char* kTieredConfig = R"(
routing:
  default_strategy: cost_optimized
  default_priority: high

migration:
  workers: 2
  max_retries: 0
  retry_base_delay_ms: 50
  poll_interval_ms: 20

regions:
  - name: on-prem-berlin
    latitude: 52.52
    longitude: 13.40

backends:
  - name: hot
    memory: {}
    profile:
      avg_latency_ms: 5
      throughput_mbps: 800
      storage_cost_per_gb: 0.08
      region: eu-central-1
  - name: archive
    memory: {}
    profile:
      avg_latency_ms: 40
      throughput_mbps: 120
      storage_cost_per_gb: 0.01
      retrieval_cost_per_gb: 0.02
      region: on-prem-berlin
)";

void TestUnsetValuesResolveToDefaults() {
  StoreRecorder stores;
  auto          config = ConfigLoader::LoadFromString("backends:\n  - name: only\n    memory: {}\n");
  Application   app    = datarouter::factory::Build(config, stores.Factory());

  assert(std::dynamic_pointer_cast<datarouter::db::memory::MemoryRepository>(app.repository));

  assert(app.executor_options.workers == 4);
  assert(app.executor_options.poll_interval == std::chrono::milliseconds(200));
  assert(app.retry.max_retries == 3);
  assert(app.retry.base_delay == std::chrono::milliseconds(1000));
  assert(app.router_defaults.strategy == RoutingStrategy::kBalanced);
  assert(app.router_defaults.priority == Priority::kNormal);
  assert(!app.collect_periodically);
  assert(!app.executor->Running());

  assert(stores.created.size() == 1);
  assert(app.backends->Names() == std::vector<std::string>{"only"});
  // no profile, so nothing to route to yet
  assert(app.metrics->GetAll().empty());
}

void TestConfiguredValuesAndProfilesApply() {
  StoreRecorder stores;
  Application   app = datarouter::factory::Build(ConfigLoader::LoadFromString(kTieredConfig), stores.Factory());

  assert(app.executor_options.workers == 2);
  assert(app.executor_options.poll_interval == std::chrono::milliseconds(20));
  // an explicit zero disables retries rather than falling back to the default
  assert(app.retry.max_retries == 0);
  assert(app.retry.base_delay == std::chrono::milliseconds(50));
  assert(app.router_defaults.strategy == RoutingStrategy::kCostOptimized);
  assert(app.router_defaults.priority == Priority::kHigh);

  assert(app.regions->Lookup("on-prem-berlin")->latitude == 52.52);

  const auto archive = app.metrics->Get("archive");
  assert(archive.storage_cost_per_gb == 0.01);
  assert(archive.success_rate == 1.0);
  assert(archive.uptime_pct == 100.0);
  assert(app.regions->Locate(archive)->longitude == 13.40);
}

void TestRouteThroughBuiltServices() {
  StoreRecorder stores;
  Application   app = datarouter::factory::Build(ConfigLoader::LoadFromString(kTieredConfig), stores.Factory());

  auto routed = app.routing_service->Route("hello", {{"content_type", "text/plain"}, {"filename", "notes.txt"}}, {});
  assert(routed.ok());
  assert(routed.value->decision.strategy == RoutingStrategy::kCostOptimized);
  assert(routed.value->decision.selected_backend == "archive");
  assert(routed.value->store.success);

  auto archive = stores.created[1];
  assert(archive->Name() == "archive");
  assert(archive->Get(routed.value->store.content_id) == "hello");

  // migrations run through the same registry and repository
  datarouter::migration::StartRequest start;
  start.source_backend      = "archive";
  start.destination_backend = "hot";
  start.content_id          = routed.value->store.content_id;
  auto task                 = app.migration_service->Start(start);
  assert(task.ok());
  assert(app.migration_service->Summary().value->total_tasks == 1);
}

void TestInvalidCoordinatesFailStartup() {
  auto config = ConfigLoader::LoadFromString(kTieredConfig);
  config.mutable_regions(0)->set_latitude(95.0);

  StoreRecorder stores;
  bool          threw = false;
  try {
    (void)datarouter::factory::Build(config, stores.Factory());
  } catch (const datarouter::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDatabaseSectionSelectsRepository() {
#if DATAROUTER_DB_SQLITE
  const auto path = std::filesystem::temp_directory_path() / ("datarouter_factory_" + datarouter::util::GenerateId() + ".db");

  auto config = ConfigLoader::LoadFromString(kTieredConfig);
  config.mutable_database()->mutable_sqlite()->set_path(path.string());

  std::string rule_id;
  {
    StoreRecorder stores;
    Application   app = datarouter::factory::Build(config, stores.Factory());
    assert(std::dynamic_pointer_cast<datarouter::db::sqlite::SqliteRepository>(app.repository));

    datarouter::model::RoutingRule rule;
    rule.name               = "all-to-hot";
    rule.wildcard           = true;
    rule.preferred_backends = {"hot"};
    auto created            = app.routing_service->CreateRule(rule);
    assert(created.ok());
    rule_id = created.value->id;
  }
  {
    // rules survive a rebuild from the same database
    StoreRecorder stores;
    Application   app = datarouter::factory::Build(config, stores.Factory());
    assert(app.routing_service->GetRule(rule_id).ok());

    auto routed = app.routing_service->Route("x", {{"content_type", "text/plain"}}, {});
    assert(routed.ok() && routed.value->decision.selected_backend == "hot");
    assert(routed.value->decision.matched_rule_id == rule_id);
  }

  std::error_code ec;
  for (const auto* suffix : {"", "-wal", "-shm"})
    std::filesystem::remove(path.string() + suffix, ec);
#endif

#if !DATAROUTER_DB_POSTGRES
  {
    auto pg_config = ConfigLoader::LoadFromString(kTieredConfig);
    pg_config.mutable_database()->mutable_postgres()->set_connection_uri("postgresql://localhost/datarouter");
    StoreRecorder stores;
    bool          threw = false;
    try {
      (void)datarouter::factory::Build(pg_config, stores.Factory());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }
#endif
}

} // namespace

int main() {
  TestUnsetValuesResolveToDefaults();
  TestConfiguredValuesAndProfilesApply();
  TestRouteThroughBuiltServices();
  TestInvalidCoordinatesFailStartup();
  TestDatabaseSectionSelectsRepository();

  std::cout << "datarouter_unit_factory: pass\n";
  return 0;
}
