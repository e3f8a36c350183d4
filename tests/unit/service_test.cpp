#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/metrics/metrics_collector.hpp"
#include "internal/metrics/metrics_source.hpp"
#include "internal/migration/migration_executor.hpp"
#include "internal/service/migration_service.hpp"
#include "internal/service/routing_service.hpp"
#include "tests/support/fake_backend_store.hpp"

namespace {

using datarouter::model::BackendMetrics;
using datarouter::routing::RouteOptions;
using datarouter::service::MigrationService;
using datarouter::service::RoutingService;
using datarouter::service::ServiceContext;
using datarouter::testing::FakeBackendStore;
using datarouter::util::ErrorKind;

BackendMetrics Profile(double cost, double latency) {
  BackendMetrics m;
  m.storage_cost_per_gb = cost;
  m.avg_latency_ms      = latency;
  m.throughput_mbps     = 100;
  m.region              = "eu-west-1";
  return m;
}

struct Fixture {
  std::shared_ptr<datarouter::db::Repository>               repository = std::make_shared<datarouter::db::memory::MemoryRepository>();
  std::shared_ptr<datarouter::metrics::BackendMetricsStore> metrics    = std::make_shared<datarouter::metrics::BackendMetricsStore>();
  std::shared_ptr<datarouter::metrics::StaticMetricsSource> source     = std::make_shared<datarouter::metrics::StaticMetricsSource>();
  std::shared_ptr<datarouter::storage::BackendRegistry>     backends   = std::make_shared<datarouter::storage::BackendRegistry>();
  std::shared_ptr<datarouter::migration::MigrationScheduler> scheduler = std::make_shared<datarouter::migration::MigrationScheduler>();
  std::shared_ptr<FakeBackendStore>                         hot        = std::make_shared<FakeBackendStore>("hot");
  std::shared_ptr<FakeBackendStore>                         cold       = std::make_shared<FakeBackendStore>("cold");

  ServiceContext                    ctx;
  std::unique_ptr<RoutingService>   routing;
  std::unique_ptr<MigrationService> migration;

  explicit Fixture(bool with_collector = true) {
    backends->Register(hot);
    backends->Register(cold);
    source->Set("hot", Profile(0.10, 5));
    source->Set("cold", Profile(0.01, 80));

    auto tasks = std::make_shared<datarouter::migration::TaskStore>(repository, scheduler);

    ctx.metrics = metrics;
    if (with_collector) {
      ctx.collector = std::make_shared<datarouter::metrics::MetricsCollector>(source, metrics, std::chrono::milliseconds(1000));
    } else {
      metrics->Update("hot", Profile(0.10, 5));
      metrics->Update("cold", Profile(0.01, 80));
    }
    ctx.rules  = std::make_shared<datarouter::routing::RuleEngine>(repository);
    ctx.router = std::make_shared<datarouter::routing::DataRouter>(
        ctx.rules, std::make_shared<datarouter::routing::ScoringEngine>(metrics, std::make_shared<datarouter::metrics::RegionCatalog>()), backends);
    ctx.migrations = std::make_shared<datarouter::migration::MigrationController>(
        tasks, std::make_shared<datarouter::migration::PolicyStore>(repository), backends, metrics);
    ctx.executor = std::make_shared<datarouter::migration::MigrationExecutor>(tasks, backends, scheduler,
                                                                              datarouter::migration::ExecutorOptions{1, std::chrono::milliseconds(10)});

    routing   = std::make_unique<RoutingService>(ctx);
    migration = std::make_unique<MigrationService>(ctx);
  }
};

void TestRoutingErrorsAreStructured() {
  Fixture f;

  // nothing collected yet: no backend is eligible
  auto none = f.routing->Analyze("hello", {}, {});
  assert(!none.ok());
  assert(none.status.kind == ErrorKind::kNoEligibleBackend);
  assert(!none.value);

  auto collected = f.routing->CollectMetrics();
  assert(collected.ok());
  assert(collected.value->size() == 2);
  assert(f.routing->GetAllMetrics().value->size() == 2);

  RouteOptions cheap;
  cheap.strategy = datarouter::model::RoutingStrategy::kCostOptimized;
  auto decision  = f.routing->Analyze("hello", {}, cheap);
  assert(decision.ok());
  assert(decision.value->selected_backend == "cold");
  assert(f.cold->adds == 0);

  assert(f.routing->GetMetrics("tape").status.kind == ErrorKind::kNotFound);
  assert(f.routing->GetRule("nope").status.kind == ErrorKind::kNotFound);

  datarouter::model::RoutingRule bad;
  bad.name           = "bad";
  bad.min_size_bytes = 10;
  bad.max_size_bytes = 1;
  auto rejected      = f.routing->CreateRule(bad);
  assert(rejected.status.kind == ErrorKind::kValidation);
  assert(!rejected.status.message.empty());

  datarouter::model::RoutingRule good;
  good.name               = "to-hot";
  good.preferred_backends = {"hot"};
  good.wildcard           = true;
  auto created            = f.routing->CreateRule(good);
  assert(created.ok() && !created.value->id.empty());
  assert(f.routing->GetRule(created.value->id).ok());
  assert(f.routing->ListRules().value->size() == 1);
  assert(*f.routing->DeleteRule(created.value->id).value);
  assert(!*f.routing->DeleteRule(created.value->id).value);

  auto updated = f.routing->UpdateMetrics("tape", Profile(0.001, 5000));
  assert(updated.ok() && updated.value->avg_latency_ms == 5000);
}

void TestRouteReportsStoreFailure() {
  Fixture f(false);
  f.hot->fail_adds = 1;

  RouteOptions options;
  options.backend = "hot";

  auto result = f.routing->Route("payload", {}, options);
  assert(result.ok());
  assert(result.value->decision.backend_override);
  assert(!result.value->store.success);
  assert(result.value->store.error_kind == ErrorKind::kBackendUnavailable);

  options.backend = "tape";
  assert(f.routing->Route("payload", {}, options).status.kind == ErrorKind::kNotFound);
}

void TestCollectWithoutCollectorIsInvalidState() {
  Fixture f(false);
  f.ctx.collector.reset();
  RoutingService routing(f.ctx);
  assert(routing.CollectMetrics().status.kind == ErrorKind::kInvalidState);
}

void TestMigrationErrorsAreStructured() {
  Fixture f(false);
  f.hot->Put("cid", "bytes");

  auto started = f.migration->Start({"hot", "cold", "cid", {}});
  assert(started.ok());
  assert(f.migration->Start({"hot", "cold", "cid", {}}).status.kind == ErrorKind::kDuplicateTask);
  assert(f.migration->Start({"hot", "hot", "cid", {}}).status.kind == ErrorKind::kValidation);
  assert(f.migration->Start({"hot", "tape", "cid", {}}).status.kind == ErrorKind::kNotFound);
  assert(f.migration->Get("missing").status.kind == ErrorKind::kNotFound);
  assert(f.migration->Cleanup(-1).status.kind == ErrorKind::kValidation);

  auto summary = f.migration->Summary();
  assert(summary.ok() && !summary.value->executor_running);

  f.ctx.executor->Start();
  summary = f.migration->Summary();
  assert(summary.value->executor_running);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (f.migration->Get(started.value->id).value->status != datarouter::model::MigrationStatus::kCompleted &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  f.ctx.executor->Stop();

  assert(f.cold->Has("cid"));
  assert(f.migration->Cancel(started.value->id).status.kind == ErrorKind::kInvalidState);
  assert(f.migration->Summary().value->total_bytes_migrated == 5);
}

void TestPolicyOperations() {
  Fixture f(false);
  f.hot->Put("a", "1");
  f.hot->Put("b", "2");

  datarouter::model::MigrationPolicy policy;
  policy.name                = "drain-hot";
  policy.source_backend      = "hot";
  policy.destination_backend = "cold";
  assert(f.migration->CreatePolicy(policy).ok());
  assert(f.migration->CreatePolicy(policy).status.kind == ErrorKind::kValidation);

  auto ids = f.migration->ExecutePolicy("drain-hot");
  assert(ids.ok() && ids.value->size() == 2);
  assert(f.migration->ExecutePolicy("ghost").status.kind == ErrorKind::kNotFound);

  auto tasks = f.migration->List({});
  assert(tasks.ok() && tasks.value->size() == 2);
  assert(f.migration->GetBatch(tasks.value->front().batch_id).ok());

  policy.enabled = false;
  assert(f.migration->UpdatePolicy("drain-hot", policy).ok());
  assert(f.migration->ExecutePolicy("drain-hot").status.kind == ErrorKind::kInvalidState);
  assert(f.migration->ListPolicies().value->size() == 1);
  assert(f.migration->GetPolicy("drain-hot").value->run_count == 1);
  assert(*f.migration->DeletePolicy("drain-hot").value);
  assert(f.migration->GetPolicy("drain-hot").status.kind == ErrorKind::kNotFound);

  auto estimate = f.migration->Estimate("hot", "cold", "a");
  assert(estimate.ok() && estimate.value->size_bytes == 1);
  assert(f.migration->Batch({"hot", "cold", {}, {}}).status.kind == ErrorKind::kValidation);
}

} // namespace

int main() {
  TestRoutingErrorsAreStructured();
  TestRouteReportsStoreFailure();
  TestCollectWithoutCollectorIsInvalidState();
  TestMigrationErrorsAreStructured();
  TestPolicyOperations();

  std::cout << "datarouter_unit_services: pass\n";
  return 0;
}
