#include "task_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace datarouter::migration {

using observability::IntField;
using observability::StringField;

namespace {

std::optional<uint64_t> ToMillis(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToUnixMillis(*tp);
}

std::optional<util::TimePoint> FromMillis(const std::optional<uint64_t>& ms) {
  if (!ms) return std::nullopt;
  return util::FromUnixMillis(*ms);
}

db::model::MigrationTaskRecord ToRecord(const model::MigrationTask& task) {
  db::model::MigrationTaskRecord r;
  r.id                     = task.id;
  r.source_backend         = task.source_backend;
  r.destination_backend    = task.destination_backend;
  r.content_id             = task.content_id;
  r.status                 = static_cast<int32_t>(task.status);
  r.priority               = static_cast<int32_t>(task.options.priority);
  r.delete_source          = task.options.delete_source;
  r.verify_integrity       = task.options.verify_integrity;
  r.batch_id               = task.batch_id;
  r.policy_name            = task.policy_name;
  r.created_at_ms          = util::ToUnixMillis(task.created_at);
  r.started_at_ms          = ToMillis(task.started_at);
  r.completed_at_ms        = ToMillis(task.completed_at);
  r.eligible_at_ms         = util::ToUnixMillis(task.eligible_at);
  r.error                  = task.error;
  r.retry_count            = task.retry_count;
  r.destination_content_id = task.destination_content_id;
  r.bytes_transferred      = task.bytes_transferred;
  return r;
}

model::MigrationTask FromRecord(const db::model::MigrationTaskRecord& r) {
  model::MigrationTask task;
  task.id                       = r.id;
  task.source_backend           = r.source_backend;
  task.destination_backend      = r.destination_backend;
  task.content_id               = r.content_id;
  task.status                   = model::StatusFromInt(r.status);
  task.options.priority         = model::PriorityFromInt(r.priority);
  task.options.delete_source    = r.delete_source;
  task.options.verify_integrity = r.verify_integrity;
  task.batch_id                 = r.batch_id;
  task.policy_name              = r.policy_name;
  task.created_at               = util::FromUnixMillis(r.created_at_ms);
  task.started_at               = FromMillis(r.started_at_ms);
  task.completed_at             = FromMillis(r.completed_at_ms);
  task.eligible_at              = util::FromUnixMillis(r.eligible_at_ms);
  task.error                    = r.error;
  task.retry_count              = r.retry_count;
  task.destination_content_id   = r.destination_content_id;
  task.bytes_transferred        = r.bytes_transferred;
  return task;
}

model::MigrationTask NewTask(const model::TaskSpec& spec, util::TimePoint now) {
  model::MigrationTask task;
  task.id                  = util::GenerateId();
  task.source_backend      = spec.source_backend;
  task.destination_backend = spec.destination_backend;
  task.content_id          = spec.content_id;
  task.status              = model::MigrationStatus::kQueued;
  task.options             = spec.options;
  task.batch_id            = spec.batch_id;
  task.policy_name         = spec.policy_name;
  task.created_at          = now;
  task.eligible_at         = now;
  return task;
}

void Transition(model::MigrationTask& task, model::MigrationStatus to) {
  if (!model::CanTransition(task.status, to)) {
    throw util::InvalidState("task " + task.id + " cannot move from " + std::string(model::ToString(task.status)) + " to " +
                             std::string(model::ToString(to)));
  }
  task.status = to;
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<MigrationScheduler> scheduler, RetryPolicy retry)
    : repository_(std::move(repository)), scheduler_(std::move(scheduler)), retry_(retry) {
}

void TaskStore::Wake() {
  if (scheduler_) scheduler_->Notify();
}

model::MigrationTask TaskStore::Create(const model::TaskSpec& spec) {
  auto task = NewTask(spec, util::Now());
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    if (auto existing = repository_->FindActiveTask(*tx, spec.source_backend, spec.destination_backend, spec.content_id)) {
      throw util::DuplicateTask("active migration " + existing->id + " already exists for " + spec.content_id);
    }

    auto record = ToRecord(task);
    db::ThrowIfDbError(repository_->InsertTask(*tx, record), "create migration");
    tx->Commit();
  }

  DATAROUTER_LOG_INFO("Migration queued", {StringField("task_id", task.id), StringField("source", task.source_backend),
                                           StringField("destination", task.destination_backend), StringField("content_id", task.content_id)});
  Wake();
  return task;
}

BatchOutcome TaskStore::CreateBatch(const std::string& policy_name, const std::vector<model::TaskSpec>& specs) {
  const auto   now = util::Now();
  BatchOutcome out;
  out.batch.batch_id    = util::GenerateId();
  out.batch.policy_name = policy_name;
  out.batch.created_at  = now;

  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    for (auto spec : specs) {
      if (auto existing = repository_->FindActiveTask(*tx, spec.source_backend, spec.destination_backend, spec.content_id)) {
        out.tasks.push_back(FromRecord(*existing));
        continue;
      }

      spec.batch_id    = out.batch.batch_id;
      spec.policy_name = policy_name;
      auto task        = NewTask(spec, now);
      auto record      = ToRecord(task);
      db::ThrowIfDbError(repository_->InsertTask(*tx, record), "create batch migration");
      out.tasks.push_back(std::move(task));
      ++out.created;
    }

    for (const auto& task : out.tasks)
      out.batch.task_ids.push_back(task.id);

    db::model::MigrationBatchRecord batch;
    batch.batch_id      = out.batch.batch_id;
    batch.policy_name   = policy_name;
    batch.created_at_ms = util::ToUnixMillis(now);
    batch.task_ids_json = util::EncodeStringList(out.batch.task_ids);
    db::ThrowIfDbError(repository_->InsertBatch(*tx, batch), "create batch");
    tx->Commit();
  }

  DATAROUTER_LOG_INFO("Migration batch queued",
                      {StringField("batch_id", out.batch.batch_id), StringField("policy", policy_name),
                       IntField("created", static_cast<int64_t>(out.created)), IntField("total", static_cast<int64_t>(out.tasks.size()))});
  if (out.created > 0) Wake();
  return out;
}

std::optional<model::MigrationTask> TaskStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetTask(*tx, id);
  tx->Commit();
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::vector<model::MigrationTask> TaskStore::List(const model::TaskQuery& query) {
  db::TaskFilter filter;
  if (query.status) filter.status = static_cast<int32_t>(*query.status);
  filter.source_backend      = query.source_backend;
  filter.destination_backend = query.destination_backend;
  filter.batch_id            = query.batch_id;
  filter.policy_name         = query.policy_name;
  filter.limit               = query.limit;
  filter.offset              = query.offset;

  std::vector<db::model::MigrationTaskRecord> records;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    records            = repository_->ListTasks(*tx, filter);
    tx->Commit();
  }

  std::vector<model::MigrationTask> out;
  out.reserve(records.size());
  for (const auto& r : records)
    out.push_back(FromRecord(r));
  return out;
}

std::optional<model::MigrationBatch> TaskStore::GetBatch(const std::string& batch_id) {
  std::optional<db::model::MigrationBatchRecord> record;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    record             = repository_->GetBatch(*tx, batch_id);
    tx->Commit();
  }
  if (!record) return std::nullopt;

  model::MigrationBatch batch;
  batch.batch_id    = record->batch_id;
  batch.policy_name = record->policy_name;
  batch.created_at  = util::FromUnixMillis(record->created_at_ms);
  batch.task_ids    = util::DecodeStringList(record->task_ids_json);
  return batch;
}

std::optional<model::MigrationTask> TaskStore::ClaimNext() {
  const auto now = util::Now();

  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->NextQueuedTask(*tx, util::ToUnixMillis(now));
  if (!record) {
    tx->Commit();
    return std::nullopt;
  }

  auto task = FromRecord(*record);
  Transition(task, model::MigrationStatus::kInProgress);
  task.started_at = now;
  db::ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "claim migration");
  tx->Commit();

  DATAROUTER_LOG_DEBUG("Migration claimed", {StringField("task_id", task.id), StringField("content_id", task.content_id),
                                             IntField("retry_count", task.retry_count)});
  return task;
}

bool TaskStore::MarkCompleted(const std::string& id, const std::string& destination_content_id, std::uint64_t bytes_transferred) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetTask(*tx, id);
  if (!record || record->status != db::kTaskInProgress) {
    tx->Commit();
    return false;
  }

  auto task = FromRecord(*record);
  Transition(task, model::MigrationStatus::kCompleted);
  task.completed_at           = util::Now();
  task.destination_content_id = destination_content_id;
  task.bytes_transferred      = bytes_transferred;
  task.error.clear();
  db::ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "complete migration");
  tx->Commit();
  return true;
}

FailureOutcome TaskStore::RecordFailure(const std::string& id, const std::string& error) {
  FailureOutcome outcome;
  model::MigrationTask task;
  {
    std::lock_guard lock(mutex_);
    auto            tx     = repository_->Begin();
    auto            record = repository_->GetTask(*tx, id);
    if (!record || record->status != db::kTaskInProgress) {
      tx->Commit();
      return FailureOutcome::kIgnored;
    }

    task       = FromRecord(*record);
    task.error = error;
    const auto now = util::Now();
    if (task.retry_count < retry_.max_retries) {
      // base * 2^retries so far
      const auto delay = retry_.base_delay * (std::int64_t{1} << std::min<std::uint32_t>(task.retry_count, 30));
      Transition(task, model::MigrationStatus::kQueued);
      ++task.retry_count;
      task.eligible_at = now + delay;
      outcome          = FailureOutcome::kRequeued;
    } else {
      Transition(task, model::MigrationStatus::kFailed);
      task.completed_at = now;
      outcome           = FailureOutcome::kFailed;
    }
    db::ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "record migration failure");
    tx->Commit();
  }

  if (outcome == FailureOutcome::kRequeued) {
    DATAROUTER_LOG_WARN("Migration retry scheduled", {StringField("task_id", id), IntField("retry_count", task.retry_count),
                                                      StringField("error", error)});
    Wake();
  } else {
    DATAROUTER_LOG_ERROR("Migration failed", {StringField("task_id", id), IntField("retry_count", task.retry_count),
                                              StringField("error", error)});
  }
  return outcome;
}

bool TaskStore::IsCancelled(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetTask(*tx, id);
  tx->Commit();
  return !record || record->status == static_cast<int32_t>(model::MigrationStatus::kCancelled);
}

model::MigrationTask TaskStore::Cancel(const std::string& id) {
  model::MigrationTask task;
  {
    std::lock_guard lock(mutex_);
    auto            tx     = repository_->Begin();
    auto            record = repository_->GetTask(*tx, id);
    if (!record) throw util::NotFound("migration not found: " + id);

    task = FromRecord(*record);
    if (model::IsTerminal(task.status)) {
      throw util::InvalidState("migration " + id + " is already " + std::string(model::ToString(task.status)));
    }
    Transition(task, model::MigrationStatus::kCancelled);
    task.completed_at = util::Now();
    db::ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "cancel migration");
    tx->Commit();
  }

  DATAROUTER_LOG_INFO("Migration cancelled", {StringField("task_id", id)});
  return task;
}

std::uint64_t TaskStore::CleanupOlderThan(std::int64_t days) {
  if (days < 0) throw util::ValidationError("days must not be negative");

  // saturate at the epoch; hours(24) * days overflows chrono nanoseconds long before this does
  constexpr std::uint64_t kDayMs    = 86'400'000;
  const std::uint64_t     now_ms    = util::ToUnixMillis(util::Now());
  const auto              span_days = static_cast<std::uint64_t>(days);
  const std::uint64_t     cutoff_ms = span_days > now_ms / kDayMs ? 0 : now_ms - span_days * kDayMs;

  std::uint64_t removed = 0;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteTerminalTasks(*tx, cutoff_ms, removed), "cleanup migrations");
    tx->Commit();
  }

  DATAROUTER_LOG_INFO("Migrations cleaned up", {IntField("days", days), IntField("removed", static_cast<int64_t>(removed))});
  return removed;
}

std::map<model::MigrationStatus, std::uint64_t> TaskStore::CountByStatus() {
  std::map<int32_t, uint64_t> raw;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    raw                = repository_->CountTasksByStatus(*tx);
    tx->Commit();
  }

  std::map<model::MigrationStatus, std::uint64_t> counts;
  for (auto status : model::kAllStatuses)
    counts[status] = 0;
  for (const auto& [status, count] : raw)
    counts[model::StatusFromInt(status)] += count;
  return counts;
}

std::uint64_t TaskStore::TotalBytesMigrated() {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  auto            total = repository_->SumBytesTransferred(*tx);
  tx->Commit();
  return total;
}

std::uint64_t TaskStore::RequeueInterrupted() {
  std::uint64_t requeued = 0;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    db::TaskFilter filter;
    filter.status = db::kTaskInProgress;
    for (const auto& record : repository_->ListTasks(*tx, filter)) {
      auto task = FromRecord(record);
      Transition(task, model::MigrationStatus::kQueued);
      task.started_at.reset();
      task.eligible_at = util::Now();
      db::ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "requeue migration");
      ++requeued;
    }
    tx->Commit();
  }

  if (requeued > 0) {
    DATAROUTER_LOG_WARN("Interrupted migrations requeued", {IntField("count", static_cast<int64_t>(requeued))});
    Wake();
  }
  return requeued;
}

} // namespace datarouter::migration
