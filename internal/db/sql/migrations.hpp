#pragma once

#include <string>
#include <vector>

namespace datarouter::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements ExecuteSQL().
*/

class SchemaExecutor {
 public:
  virtual ~SchemaExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Idempotent DDL, in execution order.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

void RunMigrations(SchemaExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace datarouter::db::sql
