#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/db/sql/task_query.hpp"

namespace datarouter::db::sqlite {

namespace {

constexpr const char* kRuleColumns =
    "id,name,categories,patterns,min_size_bytes,max_size_bytes,preferred,excluded,priority,strategy,custom_factors,wildcard,active,"
    "created_at_ms,updated_at_ms";

constexpr const char* kPolicyColumns =
    "name,description,source_backend,destination_backend,filter_type,filter_prefix,filter_custom,filter_min_size_bytes,"
    "filter_max_size_bytes,schedule,priority,delete_source,verify_integrity,enabled,created_at_ms,updated_at_ms,last_run_at_ms,"
    "run_count,total_tasks_created";

constexpr const char* kTaskColumns =
    "id,seq,source_backend,destination_backend,content_id,status,priority,delete_source,verify_integrity,batch_id,policy_name,"
    "created_at_ms,started_at_ms,completed_at_ms,eligible_at_ms,error,retry_count,destination_content_id,bytes_transferred";

/*
  Prepared statement owned for one call. Bind indexes are 1-based,
  column indexes 0-based, as in the C API.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK;
  }
  int PrepareCode() const {
    return rc_;
  }

  void RequirePrepared() const {
    if (!Prepared()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

  void Bind(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
  }
  void Bind(int idx, uint64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
  }
  void Bind(int idx, int32_t v) {
    sqlite3_bind_int(st_, idx, v);
  }
  void Bind(int idx, bool v) {
    sqlite3_bind_int(st_, idx, v ? 1 : 0);
  }
  void Bind(int idx, const std::optional<uint64_t>& v) {
    if (v) {
      Bind(idx, *v);
    } else {
      sqlite3_bind_null(st_, idx);
    }
  }
  void Bind(int idx, const std::optional<std::string>& v) {
    if (v) {
      Bind(idx, *v);
    } else {
      sqlite3_bind_null(st_, idx);
    }
  }
  void Bind(int idx, const sql::Param& p) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st_, idx);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(st_, idx, value);
          } else {
            Bind(idx, value);
          }
        },
        p);
  }

  int Step() {
    return sqlite3_step(st_);
  }

  std::string Text(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  uint64_t U64(int col) const {
    return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
  }
  int32_t I32(int col) const {
    return sqlite3_column_int(st_, col);
  }
  bool Flag(int col) const {
    return sqlite3_column_int(st_, col) != 0;
  }
  bool Null(int col) const {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }
  std::optional<uint64_t> OptU64(int col) const {
    if (Null(col)) return std::nullopt;
    return U64(col);
  }
  std::optional<std::string> OptText(int col) const {
    if (Null(col)) return std::nullopt;
    return Text(col);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// Runs a write statement; NotFound when it touched no row and require_change is set.
Result Finish(sqlite3* db, Statement& st, bool require_change, const std::string& what) {
  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (require_change && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, what);
  return Result::Ok();
}

void ThrowOnStepError(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

model::RoutingRuleRecord ReadRule(const Statement& st) {
  model::RoutingRuleRecord r;
  r.id                  = st.Text(0);
  r.name                = st.Text(1);
  r.categories_json     = st.Text(2);
  r.patterns_json       = st.Text(3);
  r.min_size_bytes      = st.OptU64(4);
  r.max_size_bytes      = st.OptU64(5);
  r.preferred_json      = st.Text(6);
  r.excluded_json       = st.Text(7);
  r.priority            = st.I32(8);
  r.strategy            = st.I32(9);
  r.custom_factors_json = st.Text(10);
  r.wildcard            = st.Flag(11);
  r.active              = st.Flag(12);
  r.created_at_ms       = st.U64(13);
  r.updated_at_ms       = st.U64(14);
  return r;
}

void BindRule(Statement& st, const model::RoutingRuleRecord& r) {
  st.Bind(1, r.id);
  st.Bind(2, r.name);
  st.Bind(3, r.categories_json);
  st.Bind(4, r.patterns_json);
  st.Bind(5, r.min_size_bytes);
  st.Bind(6, r.max_size_bytes);
  st.Bind(7, r.preferred_json);
  st.Bind(8, r.excluded_json);
  st.Bind(9, r.priority);
  st.Bind(10, r.strategy);
  st.Bind(11, r.custom_factors_json);
  st.Bind(12, r.wildcard);
  st.Bind(13, r.active);
  st.Bind(14, r.created_at_ms);
  st.Bind(15, r.updated_at_ms);
}

model::MigrationPolicyRecord ReadPolicy(const Statement& st) {
  model::MigrationPolicyRecord r;
  r.name                  = st.Text(0);
  r.description           = st.Text(1);
  r.source_backend        = st.Text(2);
  r.destination_backend   = st.Text(3);
  r.filter_type           = st.OptText(4);
  r.filter_prefix         = st.OptText(5);
  r.filter_custom_json    = st.Text(6);
  r.filter_min_size_bytes = st.OptU64(7);
  r.filter_max_size_bytes = st.OptU64(8);
  r.schedule              = st.I32(9);
  r.priority              = st.I32(10);
  r.delete_source         = st.Flag(11);
  r.verify_integrity      = st.Flag(12);
  r.enabled               = st.Flag(13);
  r.created_at_ms         = st.U64(14);
  r.updated_at_ms         = st.U64(15);
  r.last_run_at_ms        = st.OptU64(16);
  r.run_count             = st.U64(17);
  r.total_tasks_created   = st.U64(18);
  return r;
}

void BindPolicy(Statement& st, const model::MigrationPolicyRecord& r) {
  st.Bind(1, r.name);
  st.Bind(2, r.description);
  st.Bind(3, r.source_backend);
  st.Bind(4, r.destination_backend);
  st.Bind(5, r.filter_type);
  st.Bind(6, r.filter_prefix);
  st.Bind(7, r.filter_custom_json);
  st.Bind(8, r.filter_min_size_bytes);
  st.Bind(9, r.filter_max_size_bytes);
  st.Bind(10, r.schedule);
  st.Bind(11, r.priority);
  st.Bind(12, r.delete_source);
  st.Bind(13, r.verify_integrity);
  st.Bind(14, r.enabled);
  st.Bind(15, r.created_at_ms);
  st.Bind(16, r.updated_at_ms);
  st.Bind(17, r.last_run_at_ms);
  st.Bind(18, r.run_count);
  st.Bind(19, r.total_tasks_created);
}

model::MigrationTaskRecord ReadTask(const Statement& st) {
  model::MigrationTaskRecord r;
  r.id                     = st.Text(0);
  r.seq                    = st.U64(1);
  r.source_backend         = st.Text(2);
  r.destination_backend    = st.Text(3);
  r.content_id             = st.Text(4);
  r.status                 = st.I32(5);
  r.priority               = st.I32(6);
  r.delete_source          = st.Flag(7);
  r.verify_integrity       = st.Flag(8);
  r.batch_id               = st.Text(9);
  r.policy_name            = st.Text(10);
  r.created_at_ms          = st.U64(11);
  r.started_at_ms          = st.OptU64(12);
  r.completed_at_ms        = st.OptU64(13);
  r.eligible_at_ms         = st.U64(14);
  r.error                  = st.Text(15);
  r.retry_count            = static_cast<uint32_t>(st.U64(16));
  r.destination_content_id = st.Text(17);
  r.bytes_transferred      = st.U64(18);
  return r;
}

// Binds every task column except id and seq, starting at index 1.
void BindTaskBody(Statement& st, const model::MigrationTaskRecord& r) {
  st.Bind(1, r.source_backend);
  st.Bind(2, r.destination_backend);
  st.Bind(3, r.content_id);
  st.Bind(4, r.status);
  st.Bind(5, r.priority);
  st.Bind(6, r.delete_source);
  st.Bind(7, r.verify_integrity);
  st.Bind(8, r.batch_id);
  st.Bind(9, r.policy_name);
  st.Bind(10, r.created_at_ms);
  st.Bind(11, r.started_at_ms);
  st.Bind(12, r.completed_at_ms);
  st.Bind(13, r.eligible_at_ms);
  st.Bind(14, r.error);
  st.Bind(15, static_cast<uint64_t>(r.retry_count));
  st.Bind(16, r.destination_content_id);
  st.Bind(17, r.bytes_transferred);
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(sqlite3* db, Statement& st, Reader reader) {
  std::vector<Record> out;
  int                 rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    out.push_back(reader(st));
  }
  ThrowOnStepError(db, rc);
  return out;
}

template <typename Record, typename Reader>
std::optional<Record> ReadOne(sqlite3* db, Statement& st, Reader reader) {
  const int rc = st.Step();
  if (rc == SQLITE_ROW) return reader(st);
  ThrowOnStepError(db, rc);
  return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Routing rules
// ------------------------------------------------------------------

Result SqliteRepository::InsertRule(Transaction& t, const model::RoutingRuleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO routing_rules(") + kRuleColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  BindRule(st, r);
  return Finish(db, st, false, r.id);
}

Result SqliteRepository::UpdateRule(Transaction& t, const model::RoutingRuleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE routing_rules SET name=?2,categories=?3,patterns=?4,min_size_bytes=?5,max_size_bytes=?6,preferred=?7,excluded=?8,"
               "priority=?9,strategy=?10,custom_factors=?11,wildcard=?12,active=?13,created_at_ms=?14,updated_at_ms=?15 WHERE id=?1;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  BindRule(st, r);
  return Finish(db, st, true, "rule not found: " + r.id);
}

Result SqliteRepository::DeleteRule(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM routing_rules WHERE id=?;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  st.Bind(1, id);
  return Finish(db, st, true, "rule not found: " + id);
}

std::optional<model::RoutingRuleRecord> SqliteRepository::GetRule(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kRuleColumns + " FROM routing_rules WHERE id=?;");
  st.RequirePrepared();
  st.Bind(1, id);
  return ReadOne<model::RoutingRuleRecord>(db, st, ReadRule);
}

std::vector<model::RoutingRuleRecord> SqliteRepository::ListRules(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kRuleColumns + " FROM routing_rules ORDER BY id;");
  st.RequirePrepared();
  return ReadAll<model::RoutingRuleRecord>(db, st, ReadRule);
}

// ------------------------------------------------------------------
// Migration policies
// ------------------------------------------------------------------

Result SqliteRepository::InsertPolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO migration_policies(") + kPolicyColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  BindPolicy(st, r);
  return Finish(db, st, false, r.name);
}

Result SqliteRepository::UpdatePolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE migration_policies SET description=?2,source_backend=?3,destination_backend=?4,filter_type=?5,filter_prefix=?6,"
               "filter_custom=?7,filter_min_size_bytes=?8,filter_max_size_bytes=?9,schedule=?10,priority=?11,delete_source=?12,"
               "verify_integrity=?13,enabled=?14,created_at_ms=?15,updated_at_ms=?16,last_run_at_ms=?17,run_count=?18,"
               "total_tasks_created=?19 WHERE name=?1;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  BindPolicy(st, r);
  return Finish(db, st, true, "policy not found: " + r.name);
}

Result SqliteRepository::DeletePolicy(Transaction& t, const std::string& name) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM migration_policies WHERE name=?;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  st.Bind(1, name);
  return Finish(db, st, true, "policy not found: " + name);
}

std::optional<model::MigrationPolicyRecord> SqliteRepository::GetPolicy(Transaction& t, const std::string& name) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kPolicyColumns + " FROM migration_policies WHERE name=?;");
  st.RequirePrepared();
  st.Bind(1, name);
  return ReadOne<model::MigrationPolicyRecord>(db, st, ReadPolicy);
}

std::vector<model::MigrationPolicyRecord> SqliteRepository::ListPolicies(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kPolicyColumns + " FROM migration_policies ORDER BY name;");
  st.RequirePrepared();
  return ReadAll<model::MigrationPolicyRecord>(db, st, ReadPolicy);
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, const model::MigrationBatchRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO migration_batches(batch_id,policy_name,created_at_ms,task_ids) VALUES(?,?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  st.Bind(1, r.batch_id);
  st.Bind(2, r.policy_name);
  st.Bind(3, r.created_at_ms);
  st.Bind(4, r.task_ids_json);
  return Finish(db, st, false, r.batch_id);
}

std::optional<model::MigrationBatchRecord> SqliteRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT batch_id,policy_name,created_at_ms,task_ids FROM migration_batches WHERE batch_id=?;");
  st.RequirePrepared();
  st.Bind(1, batch_id);
  return ReadOne<model::MigrationBatchRecord>(db, st, [](const Statement& row) {
    model::MigrationBatchRecord r;
    r.batch_id      = row.Text(0);
    r.policy_name   = row.Text(1);
    r.created_at_ms = row.U64(2);
    r.task_ids_json = row.Text(3);
    return r;
  });
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, model::MigrationTaskRecord& r) {
  auto* db = TX(t).Handle();
  {
    Statement st(db,
                 "INSERT INTO migration_tasks(source_backend,destination_backend,content_id,status,priority,delete_source,"
                 "verify_integrity,batch_id,policy_name,created_at_ms,started_at_ms,completed_at_ms,eligible_at_ms,error,retry_count,"
                 "destination_content_id,bytes_transferred,id,seq) "
                 "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?18,(SELECT COALESCE(MAX(seq),0)+1 FROM migration_tasks));");
    if (!st.Prepared()) return Translate(db, st.PrepareCode());
    BindTaskBody(st, r);
    st.Bind(18, r.id);
    auto result = Finish(db, st, false, r.id);
    if (!result) return result;
  }

  Statement seq(db, "SELECT seq FROM migration_tasks WHERE id=?;");
  if (!seq.Prepared()) return Translate(db, seq.PrepareCode());
  seq.Bind(1, r.id);
  const int rc = seq.Step();
  if (rc != SQLITE_ROW) return Translate(db, rc == SQLITE_DONE ? SQLITE_INTERNAL : rc);
  r.seq = seq.U64(0);
  return Result::Ok();
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::MigrationTaskRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE migration_tasks SET source_backend=?1,destination_backend=?2,content_id=?3,status=?4,priority=?5,"
               "delete_source=?6,verify_integrity=?7,batch_id=?8,policy_name=?9,created_at_ms=?10,started_at_ms=?11,"
               "completed_at_ms=?12,eligible_at_ms=?13,error=?14,retry_count=?15,destination_content_id=?16,"
               "bytes_transferred=?17 WHERE id=?18;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  BindTaskBody(st, r);
  st.Bind(18, r.id);
  return Finish(db, st, true, "task not found: " + r.id);
}

std::optional<model::MigrationTaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kTaskColumns + " FROM migration_tasks WHERE id=?;");
  st.RequirePrepared();
  st.Bind(1, id);
  return ReadOne<model::MigrationTaskRecord>(db, st, ReadTask);
}

std::vector<model::MigrationTaskRecord> SqliteRepository::ListTasks(Transaction& t, const TaskFilter& filter) {
  auto*      db    = TX(t).Handle();
  const auto where = sql::TaskWhere(filter, sql::Placeholder::kQuestion);
  Statement  st(db, std::string("SELECT ") + kTaskColumns + " FROM migration_tasks" + where.text +
                        " ORDER BY created_at_ms DESC, seq DESC" + sql::TaskPage(filter, sql::Placeholder::kQuestion) + ";");
  st.RequirePrepared();
  for (std::size_t i = 0; i < where.params.size(); ++i) {
    st.Bind(static_cast<int>(i + 1), where.params[i]);
  }
  return ReadAll<model::MigrationTaskRecord>(db, st, ReadTask);
}

std::optional<model::MigrationTaskRecord> SqliteRepository::FindActiveTask(Transaction& t, const std::string& source_backend,
                                                                           const std::string& destination_backend, const std::string& content_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kTaskColumns +
                       " FROM migration_tasks WHERE source_backend=? AND destination_backend=? AND content_id=? AND status IN (0,1) LIMIT 1;");
  st.RequirePrepared();
  st.Bind(1, source_backend);
  st.Bind(2, destination_backend);
  st.Bind(3, content_id);
  return ReadOne<model::MigrationTaskRecord>(db, st, ReadTask);
}

std::optional<model::MigrationTaskRecord> SqliteRepository::NextQueuedTask(Transaction& t, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kTaskColumns +
                       " FROM migration_tasks WHERE status=0 AND eligible_at_ms<=? ORDER BY priority DESC, seq ASC LIMIT 1;");
  st.RequirePrepared();
  st.Bind(1, now_ms);
  return ReadOne<model::MigrationTaskRecord>(db, st, ReadTask);
}

std::map<int32_t, uint64_t> SqliteRepository::CountTasksByStatus(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT status, COUNT(*) FROM migration_tasks GROUP BY status;");
  st.RequirePrepared();

  std::map<int32_t, uint64_t> counts;
  int                         rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    counts[st.I32(0)] = st.U64(1);
  }
  ThrowOnStepError(db, rc);
  return counts;
}

uint64_t SqliteRepository::SumBytesTransferred(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT COALESCE(SUM(bytes_transferred),0) FROM migration_tasks;");
  st.RequirePrepared();
  const int rc = st.Step();
  ThrowOnStepError(db, rc);
  return rc == SQLITE_ROW ? st.U64(0) : 0;
}

Result SqliteRepository::DeleteTerminalTasks(Transaction& t, uint64_t cutoff_ms, uint64_t& removed) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM migration_tasks WHERE status IN (2,3,4) AND completed_at_ms IS NOT NULL AND completed_at_ms<=?;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());
  st.Bind(1, cutoff_ms);
  auto result = Finish(db, st, false, "cleanup");
  removed     = result ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

} // namespace datarouter::db::sqlite
