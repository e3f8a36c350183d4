#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace datarouter::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions; TxMutex() serializes
  them so statements of concurrent transactions never interleave.
*/
class SqliteDB final : public sql::SchemaExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements without results; throws on the first failure.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace datarouter::db::sqlite
