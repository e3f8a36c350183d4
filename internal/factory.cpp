#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/metrics/metrics_source.hpp"
#include "internal/metrics/region_catalog.hpp"
#include "internal/migration/migration_scheduler.hpp"
#include "internal/migration/policy_store.hpp"
#include "internal/migration/task_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/routing/scoring_engine.hpp"
#include "internal/service/service_context.hpp"
#if DATAROUTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DATAROUTER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if DATAROUTER_ARROW_STORAGE
#include "internal/storage/disk/disk_arrow_store.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#endif

namespace datarouter::factory {

using runtime::config::RuntimeConfig;

namespace {

constexpr std::size_t   kDefaultWorkers      = 4;
constexpr std::uint32_t kDefaultMaxRetries   = 3;
constexpr std::uint64_t kDefaultRetryDelayMs = 1000;
constexpr std::uint64_t kDefaultPollMs       = 200;
constexpr std::uint64_t kDefaultCollectMs    = 30000;

routing::RouterDefaults BuildDefaults(const runtime::config::RoutingConfig& routing) {
  routing::RouterDefaults defaults;
  if (!routing.default_strategy().empty()) defaults.strategy = model::ParseStrategy(routing.default_strategy());
  if (!routing.default_priority().empty()) defaults.priority = model::ParsePriority(routing.default_priority());
  return defaults;
}

} // namespace

storage::BackendStorePtr BuildArrowStore(const runtime::config::BackendConfig& backend) {
#if DATAROUTER_ARROW_STORAGE
  if (backend.has_disk()) {
    if (backend.disk().root_path().empty()) throw std::runtime_error("backend " + backend.name() + ": disk.root_path is required");
    return std::make_shared<storage::DiskArrowStore>(backend.name(), backend.disk().root_path(), backend.disk().fsync());
  }
  return std::make_shared<storage::RamArrowStore>(backend.name());
#else
  throw std::runtime_error("backend " + backend.name() + " requested but arrow storage not enabled at build time");
#endif
}

model::BackendMetrics ToBackendMetrics(const runtime::config::BackendProfile& profile) {
  model::BackendMetrics m;
  m.avg_latency_ms        = profile.avg_latency_ms();
  m.success_rate          = profile.has_success_rate() ? profile.success_rate() : 1.0;
  m.throughput_mbps       = profile.throughput_mbps();
  m.storage_cost_per_gb   = profile.storage_cost_per_gb();
  m.retrieval_cost_per_gb = profile.retrieval_cost_per_gb();
  m.bandwidth_cost_per_gb = profile.bandwidth_cost_per_gb();
  m.region                = profile.region();
  m.multi_region          = profile.multi_region();
  m.uptime_pct            = profile.has_uptime_pct() ? profile.uptime_pct() : 100.0;
  if (profile.has_latitude() && profile.has_longitude()) {
    m.location = model::GeoPoint{profile.latitude(), profile.longitude()};
  }
  return m;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DATAROUTER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DATAROUTER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::sql::RunMigrations(*pool, db::sql::PostgresSchema());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, const StoreFactory& make_store) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Backends and metrics
  // ------------------------------------------------------------------
  app.regions = std::make_shared<metrics::RegionCatalog>();
  for (const auto& region : config.regions())
    app.regions->Register(region.name(), model::GeoPoint{region.latitude(), region.longitude()});

  app.backends = std::make_shared<storage::BackendRegistry>();
  auto source  = std::make_shared<metrics::StaticMetricsSource>();
  for (const auto& backend : config.backends()) {
    app.backends->Register(make_store(backend));
    if (backend.has_profile()) source->Set(backend.name(), ToBackendMetrics(backend.profile()));
  }

  const auto& collection = config.metrics_collection();
  const auto  interval   = std::chrono::milliseconds(collection.interval_ms() > 0 ? collection.interval_ms() : kDefaultCollectMs);
  app.metrics              = std::make_shared<metrics::BackendMetricsStore>();
  app.collector            = std::make_shared<metrics::MetricsCollector>(source, app.metrics, interval);
  app.collect_periodically = collection.enabled();
  app.collector->Collect();

  // ------------------------------------------------------------------
  // Routing
  // ------------------------------------------------------------------
  app.rules = std::make_shared<routing::RuleEngine>(app.repository);
  app.rules->Load();

  app.router_defaults = BuildDefaults(config.routing());
  auto scoring        = std::make_shared<routing::ScoringEngine>(app.metrics, app.regions);
  app.router          = std::make_shared<routing::DataRouter>(app.rules, scoring, app.backends, app.router_defaults);

  // ------------------------------------------------------------------
  // Migration
  // ------------------------------------------------------------------
  const auto& mc = config.migration();

  app.retry.max_retries = mc.has_max_retries() ? mc.max_retries() : kDefaultMaxRetries;
  app.retry.base_delay  = std::chrono::milliseconds(mc.has_retry_base_delay_ms() ? mc.retry_base_delay_ms() : kDefaultRetryDelayMs);

  app.executor_options.workers       = mc.workers() > 0 ? mc.workers() : kDefaultWorkers;
  app.executor_options.poll_interval = std::chrono::milliseconds(mc.poll_interval_ms() > 0 ? mc.poll_interval_ms() : kDefaultPollMs);

  auto scheduler = std::make_shared<migration::MigrationScheduler>();
  auto tasks     = std::make_shared<migration::TaskStore>(app.repository, scheduler, app.retry);
  auto policies  = std::make_shared<migration::PolicyStore>(app.repository);
  app.migrations = std::make_shared<migration::MigrationController>(tasks, policies, app.backends, app.metrics);
  app.executor   = std::make_shared<migration::MigrationExecutor>(tasks, app.backends, scheduler, app.executor_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.metrics    = app.metrics;
  ctx.collector  = app.collector;
  ctx.rules      = app.rules;
  ctx.router     = app.router;
  ctx.migrations = app.migrations;
  ctx.executor   = app.executor;

  app.routing_service   = std::make_shared<service::RoutingService>(ctx);
  app.migration_service = std::make_shared<service::MigrationService>(ctx);

  DATAROUTER_LOG_INFO("Application built", {observability::IntField("backends", static_cast<int64_t>(config.backends_size())),
                                            observability::IntField("workers", static_cast<int64_t>(app.executor_options.workers))});
  return app;
}

} // namespace datarouter::factory
