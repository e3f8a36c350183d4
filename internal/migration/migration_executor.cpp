#include "migration_executor.hpp"

#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/error_kind.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace datarouter::migration {

using observability::IntField;
using observability::StringField;

namespace {

model::Metadata MigratedMetadata(model::Metadata metadata, const model::MigrationTask& task) {
  metadata["content_id"]     = task.content_id;
  metadata["migrated_from"]  = task.source_backend;
  metadata["migration_task"] = task.id;
  metadata["migration_time"] = util::ToIso8601(util::Now());
  return metadata;
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Retries untyped repository failures only; typed errors propagate at once.
template <typename Fn>
auto WriteTaskState(const model::MigrationTask& task, std::string_view step, const ExecutorOptions& options, Fn&& write) -> decltype(write()) {
  const std::size_t attempts = options.state_write_attempts > 0 ? options.state_write_attempts : 1;
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return write();
    } catch (const std::exception& e) {
      if (attempt >= attempts || util::KindOf(e) != util::ErrorKind::kInternal) throw;
      DATAROUTER_LOG_WARN("Migration state write failed, retrying", {StringField("task_id", task.id), StringField("step", step),
                                                                     IntField("attempt", static_cast<int64_t>(attempt)),
                                                                     StringField("error", e.what())});
      std::this_thread::sleep_for(options.state_write_backoff * static_cast<int64_t>(attempt));
    }
  }
}

} // namespace

MigrationExecutor::MigrationExecutor(std::shared_ptr<TaskStore> tasks, std::shared_ptr<storage::BackendRegistry> backends,
                                     std::shared_ptr<MigrationScheduler> scheduler, ExecutorOptions options)
    : tasks_(std::move(tasks)), backends_(std::move(backends)), scheduler_(std::move(scheduler)), options_(options) {
  if (options_.workers == 0) options_.workers = 1;
}

MigrationExecutor::~MigrationExecutor() {
  Stop();
}

void MigrationExecutor::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (running_) return;

  tasks_->RequeueInterrupted();
  scheduler_->Reset();
  running_ = true;

  for (std::size_t i = 0; i < options_.workers; ++i)
    workers_.emplace_back(&MigrationExecutor::Work, this, i);

  DATAROUTER_LOG_INFO("Migration executor started", {IntField("workers", static_cast<int64_t>(options_.workers)),
                                                     IntField("poll_interval_ms", options_.poll_interval.count())});
}

void MigrationExecutor::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (!running_.exchange(false)) return;

  scheduler_->Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  DATAROUTER_LOG_INFO("Migration executor stopped");
}

bool MigrationExecutor::Running() const {
  return running_;
}

void MigrationExecutor::Work(std::size_t index) {
  while (running_) {
    bool claimed = false;
    try {
      claimed = RunOnce();
    } catch (const std::exception& e) {
      DATAROUTER_LOG_ERROR("Migration worker error", {IntField("worker", static_cast<int64_t>(index)), StringField("error", e.what())});
    }

    // drain without waiting while work is available
    if (claimed) continue;
    if (!scheduler_->WaitFor(options_.poll_interval)) break;
  }
}

bool MigrationExecutor::RunOnce() {
  auto task = tasks_->ClaimNext();
  if (!task) return false;
  Process(*task);
  return true;
}

ProcessOutcome MigrationExecutor::Process(const model::MigrationTask& task) {
  observability::SpanScope span("MigrationExecutor.Process", observability::SpanKind::kConsumer);
  span.SetAttribute("migration.task_id", task.id);
  span.SetAttribute("migration.source", task.source_backend);
  span.SetAttribute("migration.destination", task.destination_backend);
  span.SetAttribute("migration.retry_count", static_cast<std::int64_t>(task.retry_count));
  span.SetFlag("migration.verify_integrity", task.options.verify_integrity);
  span.SetFlag("migration.delete_source", task.options.delete_source);

  const auto start   = std::chrono::steady_clock::now();
  auto&      metrics = observability::Metrics::Instance();

  std::uint64_t bytes = 0;
  std::string   destination_id;
  try {
    auto source      = backends_->Get(task.source_backend);
    auto destination = backends_->Get(task.destination_backend);

    const auto data     = source->Get(task.content_id);
    auto       metadata = source->GetMetadata(task.content_id);
    bytes               = data.size();

    if (tasks_->IsCancelled(task.id)) {
      DATAROUTER_LOG_INFO("Migration cancelled before write", {StringField("task_id", task.id)});
      span.AddEvent("cancelled");
      metrics.RecordMigrationOutcome("cancelled");
      return ProcessOutcome::kSkipped;
    }

    destination_id = destination->Add(data, MigratedMetadata(std::move(metadata), task));

    if (task.options.verify_integrity && destination->Get(destination_id) != data) {
      throw util::BackendUnavailable("integrity check failed for " + task.content_id + " on " + task.destination_backend);
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    const std::string error   = e.what();
    const auto        outcome = WriteTaskState(task, "record_failure", options_, [&] { return tasks_->RecordFailure(task.id, error); });
    switch (outcome) {
      case FailureOutcome::kRequeued:
        metrics.RecordMigrationOutcome("retried");
        return ProcessOutcome::kRetried;
      case FailureOutcome::kFailed:
        metrics.RecordMigrationOutcome("failed");
        return ProcessOutcome::kFailed;
      case FailureOutcome::kIgnored:
        break;
    }
    metrics.RecordMigrationOutcome("cancelled");
    return ProcessOutcome::kSkipped;
  }

  const bool completed =
      WriteTaskState(task, "mark_completed", options_, [&] { return tasks_->MarkCompleted(task.id, destination_id, bytes); });
  if (!completed) {
    // cancelled while the write was in flight
    DATAROUTER_LOG_INFO("Late migration completion ignored", {StringField("task_id", task.id)});
    metrics.RecordMigrationOutcome("cancelled");
    return ProcessOutcome::kSkipped;
  }

  if (task.options.delete_source) {
    try {
      if (!backends_->Get(task.source_backend)->Delete(task.content_id)) {
        DATAROUTER_LOG_WARN("Source content already gone", {StringField("task_id", task.id), StringField("content_id", task.content_id)});
      }
    } catch (const std::exception& e) {
      DATAROUTER_LOG_WARN("Source delete failed after migration",
                          {StringField("task_id", task.id), StringField("content_id", task.content_id), StringField("error", e.what())});
    }
  }

  const double elapsed = ElapsedMs(start);
  metrics.RecordMigrationOutcome("completed");
  metrics.ObserveMigrationDurationMs(elapsed);
  metrics.AddMigratedBytes(bytes);
  span.SetAttribute("migration.bytes", static_cast<std::int64_t>(bytes));

  DATAROUTER_LOG_INFO("Migration completed", {StringField("task_id", task.id), StringField("destination_content_id", destination_id),
                                              IntField("bytes", static_cast<int64_t>(bytes)), observability::DoubleField("duration_ms", elapsed)});
  return ProcessOutcome::kCompleted;
}

} // namespace datarouter::migration
