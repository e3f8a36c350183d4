#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/migration.hpp"
#include "migration_scheduler.hpp"

namespace datarouter::migration {

struct RetryPolicy {
  std::uint32_t             max_retries = 3;
  std::chrono::milliseconds base_delay{1000};
};

struct BatchOutcome {
  model::MigrationBatch            batch;
  std::vector<model::MigrationTask> tasks; // new and pre-existing active ones, in spec order
  std::size_t                      created = 0;
};

enum class FailureOutcome {
  kRequeued,
  kFailed,
  kIgnored, // task was no longer in progress
};

/*
  Sole owner of migration task records.

  Every read-modify-write runs under one mutex and one repository
  transaction, so the active (source, destination, content_id) check and
  the insert are a single critical section. The repository's unique
  constraint backs this up for stores shared between processes.
*/
class TaskStore {
 public:
  TaskStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<MigrationScheduler> scheduler, RetryPolicy retry = {});

  // Throws util::DuplicateTask when an active task exists for the tuple.
  model::MigrationTask Create(const model::TaskSpec& spec);

  // Skips specs that already have an active task and reports the existing
  // one instead. Always records a batch.
  BatchOutcome CreateBatch(const std::string& policy_name, const std::vector<model::TaskSpec>& specs);

  std::optional<model::MigrationTask>  Get(const std::string& id);
  std::vector<model::MigrationTask>    List(const model::TaskQuery& query);
  std::optional<model::MigrationBatch> GetBatch(const std::string& batch_id);

  // Highest priority eligible queued task, moved to in_progress.
  std::optional<model::MigrationTask> ClaimNext();

  // Write-once: only an in_progress task completes. False otherwise.
  bool MarkCompleted(const std::string& id, const std::string& destination_content_id, std::uint64_t bytes_transferred);

  FailureOutcome RecordFailure(const std::string& id, const std::string& error);

  // True when the task is cancelled or gone.
  bool IsCancelled(const std::string& id);

  // Throws util::NotFound, or util::InvalidState for terminal tasks.
  model::MigrationTask Cancel(const std::string& id);

  // Removes terminal tasks finished at least `days` ago. Throws util::ValidationError for negative days.
  std::uint64_t CleanupOlderThan(std::int64_t days);

  // Every status is present, zero when empty.
  std::map<model::MigrationStatus, std::uint64_t> CountByStatus();
  std::uint64_t                                   TotalBytesMigrated();

  // Puts in_progress tasks left by a previous run back in the queue.
  std::uint64_t RequeueInterrupted();

  const RetryPolicy& Retry() const {
    return retry_;
  }

 private:
  void Wake();

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<MigrationScheduler> scheduler_;
  RetryPolicy                         retry_;
  std::mutex                          mutex_;
};

} // namespace datarouter::migration
