#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace datarouter::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - Each transaction holds its own connection.
  - libpqxx connections are NOT thread-safe, never share one.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds shared_ptr<pqxx::connection>; dropping it returns
    the connection to the pool
*/

class PgPool : public std::enable_shared_from_this<PgPool>, public sql::SchemaExecutor {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  // Runs one statement in its own committed transaction.
  void ExecuteSQL(const std::string& sql) override;

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace datarouter::db::postgres
