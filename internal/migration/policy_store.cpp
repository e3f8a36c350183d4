#include "policy_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace datarouter::migration {

using observability::IntField;
using observability::StringField;

namespace {

db::model::MigrationPolicyRecord ToRecord(const model::MigrationPolicy& policy) {
  db::model::MigrationPolicyRecord r;
  r.name                  = policy.name;
  r.description           = policy.description;
  r.source_backend        = policy.source_backend;
  r.destination_backend   = policy.destination_backend;
  r.filter_type           = policy.content_filter.type;
  r.filter_prefix         = policy.content_filter.prefix;
  r.filter_custom_json    = util::EncodeStringMap(policy.content_filter.custom);
  r.filter_min_size_bytes = policy.content_filter.min_size_bytes;
  r.filter_max_size_bytes = policy.content_filter.max_size_bytes;
  r.schedule              = static_cast<int32_t>(policy.schedule);
  r.priority              = static_cast<int32_t>(policy.priority);
  r.delete_source         = policy.delete_source;
  r.verify_integrity      = policy.verify_integrity;
  r.enabled               = policy.enabled;
  r.created_at_ms         = util::ToUnixMillis(policy.created_at);
  r.updated_at_ms         = util::ToUnixMillis(policy.updated_at);
  if (policy.last_run_at) r.last_run_at_ms = util::ToUnixMillis(*policy.last_run_at);
  r.run_count           = policy.run_count;
  r.total_tasks_created = policy.total_tasks_created;
  return r;
}

model::MigrationPolicy FromRecord(const db::model::MigrationPolicyRecord& r) {
  model::MigrationPolicy policy;
  policy.name                          = r.name;
  policy.description                   = r.description;
  policy.source_backend                = r.source_backend;
  policy.destination_backend           = r.destination_backend;
  policy.content_filter.type           = r.filter_type;
  policy.content_filter.prefix         = r.filter_prefix;
  policy.content_filter.custom         = util::DecodeStringMap(r.filter_custom_json);
  policy.content_filter.min_size_bytes = r.filter_min_size_bytes;
  policy.content_filter.max_size_bytes = r.filter_max_size_bytes;
  policy.schedule = r.schedule == static_cast<int32_t>(model::ScheduleMode::kPeriodic) ? model::ScheduleMode::kPeriodic : model::ScheduleMode::kManual;
  policy.priority         = model::PriorityFromInt(r.priority);
  policy.delete_source    = r.delete_source;
  policy.verify_integrity = r.verify_integrity;
  policy.enabled          = r.enabled;
  policy.created_at       = util::FromUnixMillis(r.created_at_ms);
  policy.updated_at       = util::FromUnixMillis(r.updated_at_ms);
  if (r.last_run_at_ms) policy.last_run_at = util::FromUnixMillis(*r.last_run_at_ms);
  policy.run_count           = r.run_count;
  policy.total_tasks_created = r.total_tasks_created;
  return policy;
}

} // namespace

PolicyStore::PolicyStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void PolicyStore::Validate(const model::MigrationPolicy& policy) {
  if (policy.name.empty()) throw util::ValidationError("policy name is required");
  if (policy.source_backend.empty() || policy.destination_backend.empty()) {
    throw util::ValidationError("policy needs source_backend and destination_backend");
  }
  if (policy.source_backend == policy.destination_backend) {
    throw util::ValidationError("source and destination backend must differ");
  }
  if (!model::IsValid(policy.priority)) throw util::ValidationError("policy priority out of range");
  if (policy.schedule != model::ScheduleMode::kManual) {
    throw util::ValidationError("only manual schedule is supported");
  }

  const auto& filter = policy.content_filter;
  if (filter.min_size_bytes && filter.max_size_bytes && *filter.min_size_bytes > *filter.max_size_bytes) {
    throw util::ValidationError("min_size_bytes must not exceed max_size_bytes");
  }
}

model::MigrationPolicy PolicyStore::Create(model::MigrationPolicy policy) {
  Validate(policy);
  policy.created_at = util::Now();
  policy.updated_at = policy.created_at;
  policy.last_run_at.reset();
  policy.run_count           = 0;
  policy.total_tasks_created = 0;

  auto tx = repository_->Begin();
  if (repository_->GetPolicy(*tx, policy.name)) {
    throw util::ValidationError("policy already exists: " + policy.name);
  }
  db::ThrowIfDbError(repository_->InsertPolicy(*tx, ToRecord(policy)), "create policy " + policy.name);
  tx->Commit();

  DATAROUTER_LOG_INFO("Migration policy created", {StringField("policy", policy.name), StringField("source", policy.source_backend),
                                                   StringField("destination", policy.destination_backend)});
  return policy;
}

model::MigrationPolicy PolicyStore::Update(const std::string& name, model::MigrationPolicy policy) {
  policy.name = name;
  Validate(policy);

  auto tx      = repository_->Begin();
  auto current = repository_->GetPolicy(*tx, name);
  if (!current) throw util::NotFound("policy not found: " + name);

  const auto existing        = FromRecord(*current);
  policy.created_at          = existing.created_at;
  policy.updated_at          = util::Now();
  policy.last_run_at         = existing.last_run_at;
  policy.run_count           = existing.run_count;
  policy.total_tasks_created = existing.total_tasks_created;

  db::ThrowIfDbError(repository_->UpdatePolicy(*tx, ToRecord(policy)), "update policy " + name);
  tx->Commit();

  DATAROUTER_LOG_INFO("Migration policy updated", {StringField("policy", name)});
  return policy;
}

bool PolicyStore::Delete(const std::string& name) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeletePolicy(*tx, name);
  if (result.code == db::ErrorCode::NotFound) return false;
  db::ThrowIfDbError(result, "delete policy " + name);
  tx->Commit();

  DATAROUTER_LOG_INFO("Migration policy deleted", {StringField("policy", name)});
  return true;
}

std::optional<model::MigrationPolicy> PolicyStore::Get(const std::string& name) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPolicy(*tx, name);
  tx->Commit();
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::vector<model::MigrationPolicy> PolicyStore::List() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPolicies(*tx);
  tx->Commit();

  std::vector<model::MigrationPolicy> out;
  out.reserve(records.size());
  for (const auto& r : records)
    out.push_back(FromRecord(r));
  return out;
}

void PolicyStore::RecordRun(const std::string& name, std::uint64_t tasks_created) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPolicy(*tx, name);
  if (!record) throw util::NotFound("policy not found: " + name);

  record->last_run_at_ms = util::ToUnixMillis(util::Now());
  record->run_count += 1;
  record->total_tasks_created += tasks_created;
  db::ThrowIfDbError(repository_->UpdatePolicy(*tx, *record), "record policy run " + name);
  tx->Commit();

  DATAROUTER_LOG_INFO("Migration policy executed", {StringField("policy", name), IntField("tasks_created", static_cast<int64_t>(tasks_created))});
}

} // namespace datarouter::migration
