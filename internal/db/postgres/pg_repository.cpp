#include "pg_repository.hpp"

#include <string_view>
#include <type_traits>
#include <variant>

#include "internal/db/sql/task_query.hpp"

namespace datarouter::db::postgres {

namespace {

constexpr const char* kRuleColumns =
    "id,name,categories::text,patterns::text,min_size_bytes,max_size_bytes,preferred::text,excluded::text,priority,strategy,"
    "custom_factors::text,wildcard,active,created_at_ms,updated_at_ms";

constexpr const char* kPolicyColumns =
    "name,description,source_backend,destination_backend,filter_type,filter_prefix,filter_custom::text,filter_min_size_bytes,"
    "filter_max_size_bytes,schedule,priority,delete_source,verify_integrity,enabled,created_at_ms,updated_at_ms,last_run_at_ms,"
    "run_count,total_tasks_created";

constexpr const char* kTaskColumns =
    "id,seq,source_backend,destination_backend,content_id,status,priority,delete_source,verify_integrity,batch_id,policy_name,"
    "created_at_ms,started_at_ms,completed_at_ms,eligible_at_ms,error,retry_count,destination_content_id,bytes_transferred";

// Maps unique violations to `on_unique`; everything else is internal.
Result Translate(const std::exception& e, ErrorCode on_unique) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(on_unique, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result Touched(const pqxx::result& res, const std::string& what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, what);
  return Result::Ok();
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::RoutingRuleRecord ReadRule(const pqxx::row& row) {
  model::RoutingRuleRecord r;
  r.id                  = row[0].c_str();
  r.name                = row[1].c_str();
  r.categories_json     = row[2].c_str();
  r.patterns_json       = row[3].c_str();
  r.min_size_bytes      = OptU64(row[4]);
  r.max_size_bytes      = OptU64(row[5]);
  r.preferred_json      = row[6].c_str();
  r.excluded_json       = row[7].c_str();
  r.priority            = row[8].as<int32_t>();
  r.strategy            = row[9].as<int32_t>();
  r.custom_factors_json = row[10].c_str();
  r.wildcard            = row[11].as<bool>();
  r.active              = row[12].as<bool>();
  r.created_at_ms       = row[13].as<uint64_t>();
  r.updated_at_ms       = row[14].as<uint64_t>();
  return r;
}

model::MigrationPolicyRecord ReadPolicy(const pqxx::row& row) {
  model::MigrationPolicyRecord r;
  r.name                  = row[0].c_str();
  r.description           = row[1].c_str();
  r.source_backend        = row[2].c_str();
  r.destination_backend   = row[3].c_str();
  r.filter_type           = OptText(row[4]);
  r.filter_prefix         = OptText(row[5]);
  r.filter_custom_json    = row[6].c_str();
  r.filter_min_size_bytes = OptU64(row[7]);
  r.filter_max_size_bytes = OptU64(row[8]);
  r.schedule              = row[9].as<int32_t>();
  r.priority              = row[10].as<int32_t>();
  r.delete_source         = row[11].as<bool>();
  r.verify_integrity      = row[12].as<bool>();
  r.enabled               = row[13].as<bool>();
  r.created_at_ms         = row[14].as<uint64_t>();
  r.updated_at_ms         = row[15].as<uint64_t>();
  r.last_run_at_ms        = OptU64(row[16]);
  r.run_count             = row[17].as<uint64_t>();
  r.total_tasks_created   = row[18].as<uint64_t>();
  return r;
}

model::MigrationTaskRecord ReadTask(const pqxx::row& row) {
  model::MigrationTaskRecord r;
  r.id                     = row[0].c_str();
  r.seq                    = row[1].as<uint64_t>();
  r.source_backend         = row[2].c_str();
  r.destination_backend    = row[3].c_str();
  r.content_id             = row[4].c_str();
  r.status                 = row[5].as<int32_t>();
  r.priority               = row[6].as<int32_t>();
  r.delete_source          = row[7].as<bool>();
  r.verify_integrity       = row[8].as<bool>();
  r.batch_id               = row[9].c_str();
  r.policy_name            = row[10].c_str();
  r.created_at_ms          = row[11].as<uint64_t>();
  r.started_at_ms          = OptU64(row[12]);
  r.completed_at_ms        = OptU64(row[13]);
  r.eligible_at_ms         = row[14].as<uint64_t>();
  r.error                  = row[15].c_str();
  r.retry_count            = row[16].as<uint32_t>();
  r.destination_content_id = row[17].c_str();
  r.bytes_transferred      = row[18].as<uint64_t>();
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

template <typename Record, typename Reader>
std::optional<Record> ReadOne(const pqxx::result& res, Reader reader) {
  if (res.empty()) return std::nullopt;
  return reader(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Routing rules
// ------------------------------------------------------------------

Result PgRepository::InsertRule(Transaction& t, const model::RoutingRuleRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO routing_rules(") +
                                 "id,name,categories,patterns,min_size_bytes,max_size_bytes,preferred,excluded,priority,strategy,"
                                 "custom_factors,wildcard,active,created_at_ms,updated_at_ms) "
                                 "VALUES($1,$2,$3::jsonb,$4::jsonb,$5,$6,$7::jsonb,$8::jsonb,$9,$10,$11::jsonb,$12,$13,$14,$15)",
                             r.id, r.name, r.categories_json, r.patterns_json, r.min_size_bytes, r.max_size_bytes, r.preferred_json,
                             r.excluded_json, r.priority, r.strategy, r.custom_factors_json, r.wildcard, r.active, r.created_at_ms,
                             r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::AlreadyExists);
  }
}

Result PgRepository::UpdateRule(Transaction& t, const model::RoutingRuleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE routing_rules SET name=$2,categories=$3::jsonb,patterns=$4::jsonb,min_size_bytes=$5,max_size_bytes=$6,"
        "preferred=$7::jsonb,excluded=$8::jsonb,priority=$9,strategy=$10,custom_factors=$11::jsonb,wildcard=$12,active=$13,"
        "created_at_ms=$14,updated_at_ms=$15 WHERE id=$1",
        r.id, r.name, r.categories_json, r.patterns_json, r.min_size_bytes, r.max_size_bytes, r.preferred_json, r.excluded_json,
        r.priority, r.strategy, r.custom_factors_json, r.wildcard, r.active, r.created_at_ms, r.updated_at_ms);
    return Touched(res, "rule not found: " + r.id);
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::AlreadyExists);
  }
}

Result PgRepository::DeleteRule(Transaction& t, const std::string& id) {
  try {
    return Touched(TX(t).Work().exec_params("DELETE FROM routing_rules WHERE id=$1", id), "rule not found: " + id);
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::InternalError);
  }
}

std::optional<model::RoutingRuleRecord> PgRepository::GetRule(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRuleColumns + " FROM routing_rules WHERE id=$1", id);
  return ReadOne<model::RoutingRuleRecord>(res, ReadRule);
}

std::vector<model::RoutingRuleRecord> PgRepository::ListRules(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kRuleColumns + " FROM routing_rules ORDER BY id");
  return ReadAll<model::RoutingRuleRecord>(res, ReadRule);
}

// ------------------------------------------------------------------
// Migration policies
// ------------------------------------------------------------------

Result PgRepository::InsertPolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO migration_policies(name,description,source_backend,destination_backend,filter_type,filter_prefix,filter_custom,"
        "filter_min_size_bytes,filter_max_size_bytes,schedule,priority,delete_source,verify_integrity,enabled,created_at_ms,"
        "updated_at_ms,last_run_at_ms,run_count,total_tasks_created) "
        "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19)",
        r.name, r.description, r.source_backend, r.destination_backend, r.filter_type, r.filter_prefix, r.filter_custom_json,
        r.filter_min_size_bytes, r.filter_max_size_bytes, r.schedule, r.priority, r.delete_source, r.verify_integrity, r.enabled,
        r.created_at_ms, r.updated_at_ms, r.last_run_at_ms, r.run_count, r.total_tasks_created);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::AlreadyExists);
  }
}

Result PgRepository::UpdatePolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE migration_policies SET description=$2,source_backend=$3,destination_backend=$4,filter_type=$5,filter_prefix=$6,"
        "filter_custom=$7::jsonb,filter_min_size_bytes=$8,filter_max_size_bytes=$9,schedule=$10,priority=$11,delete_source=$12,"
        "verify_integrity=$13,enabled=$14,created_at_ms=$15,updated_at_ms=$16,last_run_at_ms=$17,run_count=$18,"
        "total_tasks_created=$19 WHERE name=$1",
        r.name, r.description, r.source_backend, r.destination_backend, r.filter_type, r.filter_prefix, r.filter_custom_json,
        r.filter_min_size_bytes, r.filter_max_size_bytes, r.schedule, r.priority, r.delete_source, r.verify_integrity, r.enabled,
        r.created_at_ms, r.updated_at_ms, r.last_run_at_ms, r.run_count, r.total_tasks_created);
    return Touched(res, "policy not found: " + r.name);
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::AlreadyExists);
  }
}

Result PgRepository::DeletePolicy(Transaction& t, const std::string& name) {
  try {
    return Touched(TX(t).Work().exec_params("DELETE FROM migration_policies WHERE name=$1", name), "policy not found: " + name);
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::InternalError);
  }
}

std::optional<model::MigrationPolicyRecord> PgRepository::GetPolicy(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kPolicyColumns + " FROM migration_policies WHERE name=$1", name);
  return ReadOne<model::MigrationPolicyRecord>(res, ReadPolicy);
}

std::vector<model::MigrationPolicyRecord> PgRepository::ListPolicies(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kPolicyColumns + " FROM migration_policies ORDER BY name");
  return ReadAll<model::MigrationPolicyRecord>(res, ReadPolicy);
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result PgRepository::InsertBatch(Transaction& t, const model::MigrationBatchRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO migration_batches(batch_id,policy_name,created_at_ms,task_ids) VALUES($1,$2,$3,$4::jsonb)",
                             r.batch_id, r.policy_name, r.created_at_ms, r.task_ids_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::AlreadyExists);
  }
}

std::optional<model::MigrationBatchRecord> PgRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT batch_id,policy_name,created_at_ms,task_ids::text FROM migration_batches WHERE batch_id=$1", batch_id);
  return ReadOne<model::MigrationBatchRecord>(res, [](const pqxx::row& row) {
    model::MigrationBatchRecord r;
    r.batch_id      = row[0].c_str();
    r.policy_name   = row[1].c_str();
    r.created_at_ms = row[2].as<uint64_t>();
    r.task_ids_json = row[3].c_str();
    return r;
  });
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, model::MigrationTaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO migration_tasks(id,source_backend,destination_backend,content_id,status,priority,delete_source,"
        "verify_integrity,batch_id,policy_name,created_at_ms,started_at_ms,completed_at_ms,eligible_at_ms,error,retry_count,"
        "destination_content_id,bytes_transferred) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18) RETURNING seq",
        r.id, r.source_backend, r.destination_backend, r.content_id, r.status, r.priority, r.delete_source, r.verify_integrity,
        r.batch_id, r.policy_name, r.created_at_ms, r.started_at_ms, r.completed_at_ms, r.eligible_at_ms, r.error,
        static_cast<int64_t>(r.retry_count), r.destination_content_id, r.bytes_transferred);
    r.seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // the partial index guards active tuples; any other clash is the primary key
    const bool tuple = std::string_view(e.what()).find("migration_tasks_active_tuple") != std::string_view::npos;
    return Result::Err(tuple ? ErrorCode::ConstraintViolation : ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::ConstraintViolation);
  }
}

Result PgRepository::UpdateTask(Transaction& t, const model::MigrationTaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE migration_tasks SET source_backend=$2,destination_backend=$3,content_id=$4,status=$5,priority=$6,"
        "delete_source=$7,verify_integrity=$8,batch_id=$9,policy_name=$10,created_at_ms=$11,started_at_ms=$12,"
        "completed_at_ms=$13,eligible_at_ms=$14,error=$15,retry_count=$16,destination_content_id=$17,bytes_transferred=$18 "
        "WHERE id=$1",
        r.id, r.source_backend, r.destination_backend, r.content_id, r.status, r.priority, r.delete_source, r.verify_integrity,
        r.batch_id, r.policy_name, r.created_at_ms, r.started_at_ms, r.completed_at_ms, r.eligible_at_ms, r.error,
        static_cast<int64_t>(r.retry_count), r.destination_content_id, r.bytes_transferred);
    return Touched(res, "task not found: " + r.id);
  } catch (const std::exception& e) {
    return Translate(e, ErrorCode::ConstraintViolation);
  }
}

std::optional<model::MigrationTaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM migration_tasks WHERE id=$1", id);
  return ReadOne<model::MigrationTaskRecord>(res, ReadTask);
}

std::vector<model::MigrationTaskRecord> PgRepository::ListTasks(Transaction& t, const TaskFilter& filter) {
  const auto where = sql::TaskWhere(filter, sql::Placeholder::kDollar);

  pqxx::params params;
  for (const auto& param : where.params) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            params.append();
          } else {
            params.append(value);
          }
        },
        param);
  }

  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM migration_tasks" + where.text +
                                          " ORDER BY created_at_ms DESC, seq DESC" + sql::TaskPage(filter, sql::Placeholder::kDollar),
                                      params);
  return ReadAll<model::MigrationTaskRecord>(res, ReadTask);
}

std::optional<model::MigrationTaskRecord> PgRepository::FindActiveTask(Transaction& t, const std::string& source_backend,
                                                                       const std::string& destination_backend, const std::string& content_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns +
                                          " FROM migration_tasks WHERE source_backend=$1 AND destination_backend=$2 AND content_id=$3 "
                                          "AND status IN (0,1) LIMIT 1",
                                      source_backend, destination_backend, content_id);
  return ReadOne<model::MigrationTaskRecord>(res, ReadTask);
}

std::optional<model::MigrationTaskRecord> PgRepository::NextQueuedTask(Transaction& t, uint64_t now_ms) {
  // SKIP LOCKED keeps executors in other processes from claiming the same row
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns +
                                          " FROM migration_tasks WHERE status=0 AND eligible_at_ms<=$1 ORDER BY priority DESC, seq ASC "
                                          "LIMIT 1 FOR UPDATE SKIP LOCKED",
                                      now_ms);
  return ReadOne<model::MigrationTaskRecord>(res, ReadTask);
}

std::map<int32_t, uint64_t> PgRepository::CountTasksByStatus(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT status, COUNT(*) FROM migration_tasks GROUP BY status");

  std::map<int32_t, uint64_t> counts;
  for (const auto& row : res) {
    counts[row[0].as<int32_t>()] = row[1].as<uint64_t>();
  }
  return counts;
}

uint64_t PgRepository::SumBytesTransferred(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COALESCE(SUM(bytes_transferred),0)::bigint FROM migration_tasks");
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteTerminalTasks(Transaction& t, uint64_t cutoff_ms, uint64_t& removed) {
  try {
    auto res = TX(t).Work().exec_params(
        "DELETE FROM migration_tasks WHERE status IN (2,3,4) AND completed_at_ms IS NOT NULL AND completed_at_ms<=$1", cutoff_ms);
    removed = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    removed = 0;
    return Translate(e, ErrorCode::InternalError);
  }
}

} // namespace datarouter::db::postgres
