#include "migrations.hpp"

namespace datarouter::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS routing_rules (id TEXT PRIMARY KEY, name TEXT NOT NULL, categories TEXT NOT NULL, patterns TEXT NOT NULL, "
      "min_size_bytes INTEGER, max_size_bytes INTEGER, preferred TEXT NOT NULL, excluded TEXT NOT NULL, priority INTEGER NOT NULL, "
      "strategy INTEGER NOT NULL, custom_factors TEXT NOT NULL, wildcard INTEGER NOT NULL, active INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_policies (name TEXT PRIMARY KEY, description TEXT NOT NULL, source_backend TEXT NOT NULL, "
      "destination_backend TEXT NOT NULL, filter_type TEXT, filter_prefix TEXT, filter_custom TEXT NOT NULL, filter_min_size_bytes INTEGER, "
      "filter_max_size_bytes INTEGER, schedule INTEGER NOT NULL, priority INTEGER NOT NULL, delete_source INTEGER NOT NULL, "
      "verify_integrity INTEGER NOT NULL, enabled INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "last_run_at_ms INTEGER, run_count INTEGER NOT NULL, total_tasks_created INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_batches (batch_id TEXT PRIMARY KEY, policy_name TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "task_ids TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_tasks (id TEXT PRIMARY KEY, seq INTEGER NOT NULL UNIQUE, source_backend TEXT NOT NULL, "
      "destination_backend TEXT NOT NULL, content_id TEXT NOT NULL, status INTEGER NOT NULL, priority INTEGER NOT NULL, "
      "delete_source INTEGER NOT NULL, verify_integrity INTEGER NOT NULL, batch_id TEXT NOT NULL, policy_name TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL, started_at_ms INTEGER, completed_at_ms INTEGER, eligible_at_ms INTEGER NOT NULL, "
      "error TEXT NOT NULL, retry_count INTEGER NOT NULL, destination_content_id TEXT NOT NULL, bytes_transferred INTEGER NOT NULL);",

      "CREATE UNIQUE INDEX IF NOT EXISTS migration_tasks_active_tuple ON migration_tasks(source_backend, destination_backend, content_id) "
      "WHERE status IN (0,1);",

      "CREATE INDEX IF NOT EXISTS migration_tasks_claim ON migration_tasks(status, priority DESC, seq);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS routing_rules (id TEXT PRIMARY KEY, name TEXT NOT NULL, categories JSONB NOT NULL, patterns JSONB NOT NULL, "
      "min_size_bytes BIGINT, max_size_bytes BIGINT, preferred JSONB NOT NULL, excluded JSONB NOT NULL, priority SMALLINT NOT NULL, "
      "strategy SMALLINT NOT NULL, custom_factors JSONB NOT NULL, wildcard BOOLEAN NOT NULL, active BOOLEAN NOT NULL, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_policies (name TEXT PRIMARY KEY, description TEXT NOT NULL, source_backend TEXT NOT NULL, "
      "destination_backend TEXT NOT NULL, filter_type TEXT, filter_prefix TEXT, filter_custom JSONB NOT NULL, filter_min_size_bytes BIGINT, "
      "filter_max_size_bytes BIGINT, schedule SMALLINT NOT NULL, priority SMALLINT NOT NULL, delete_source BOOLEAN NOT NULL, "
      "verify_integrity BOOLEAN NOT NULL, enabled BOOLEAN NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "last_run_at_ms BIGINT, run_count BIGINT NOT NULL, total_tasks_created BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_batches (batch_id TEXT PRIMARY KEY, policy_name TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "task_ids JSONB NOT NULL);",

      "CREATE TABLE IF NOT EXISTS migration_tasks (id TEXT PRIMARY KEY, seq BIGSERIAL UNIQUE, source_backend TEXT NOT NULL, "
      "destination_backend TEXT NOT NULL, content_id TEXT NOT NULL, status SMALLINT NOT NULL, priority SMALLINT NOT NULL, "
      "delete_source BOOLEAN NOT NULL, verify_integrity BOOLEAN NOT NULL, batch_id TEXT NOT NULL, policy_name TEXT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, started_at_ms BIGINT, completed_at_ms BIGINT, eligible_at_ms BIGINT NOT NULL, "
      "error TEXT NOT NULL, retry_count INTEGER NOT NULL, destination_content_id TEXT NOT NULL, bytes_transferred BIGINT NOT NULL);",

      "CREATE UNIQUE INDEX IF NOT EXISTS migration_tasks_active_tuple ON migration_tasks(source_backend, destination_backend, content_id) "
      "WHERE status IN (0,1);",

      "CREATE INDEX IF NOT EXISTS migration_tasks_claim ON migration_tasks(status, priority DESC, seq);"};
  return kSchema;
}

void RunMigrations(SchemaExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace datarouter::db::sql
