#include "sqlite_db.hpp"

#include <stdexcept>

namespace datarouter::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void Fail(const std::string& context, const std::string& detail) {
  throw std::runtime_error("sqlite " + context + ": " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (const int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
    // sqlite3_open_v2 may hand back a handle even on failure
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    Fail("open " + path_, detail);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) == SQLITE_OK) return;

  const std::string detail = error ? error : sqlite3_errmsg(db_);
  sqlite3_free(error);
  Fail("exec", detail);
}

void SqliteDB::Configure() {
  // a ":memory:" database keeps journal_mode=memory; the pragma still succeeds
  Exec("PRAGMA journal_mode=WAL;"
       "PRAGMA synchronous=NORMAL;"
       "PRAGMA temp_store=MEMORY;");
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) Fail("busy_timeout", sqlite3_errmsg(db_));
}

} // namespace datarouter::db::sqlite
