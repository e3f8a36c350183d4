#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/model/migration.hpp"
#include "internal/storage/backend_registry.hpp"
#include "migration_scheduler.hpp"
#include "task_store.hpp"

namespace datarouter::migration {

struct ExecutorOptions {
  std::size_t               workers = 4;
  std::chrono::milliseconds poll_interval{200};
  // Attempts for each task state write (completion, failure) before giving up.
  std::size_t               state_write_attempts = 3;
  std::chrono::milliseconds state_write_backoff{50};
};

enum class ProcessOutcome {
  kCompleted,
  kRetried,
  kFailed,
  kSkipped, // cancelled before or during the transfer
};

/*
  Background migration workers.

  Each worker claims one task at a time from the TaskStore and runs it to
  completion:

      source.Get -> cancellation check -> destination.Add
        -> [verify] -> MarkCompleted -> [delete source]

  Errors go through TaskStore::RecordFailure, which decides between a
  delayed requeue and a terminal failure. Task state writes that fail
  with a repository error are retried with linear backoff; a task whose
  state still cannot be written stays in progress and is requeued by
  the next Start(). The scheduler only wakes idle
  workers; the poll interval covers retries becoming eligible.
*/
class MigrationExecutor {
 public:
  MigrationExecutor(std::shared_ptr<TaskStore> tasks, std::shared_ptr<storage::BackendRegistry> backends,
                    std::shared_ptr<MigrationScheduler> scheduler, ExecutorOptions options = {});
  ~MigrationExecutor();

  // Requeues tasks left in progress by an earlier process, then spawns workers.
  void Start();
  void Stop();
  bool Running() const;

  // Claims and processes one task on the calling thread. False when
  // nothing was claimable.
  bool RunOnce();

  ProcessOutcome Process(const model::MigrationTask& task);

 private:
  void Work(std::size_t index);

  std::shared_ptr<TaskStore>                tasks_;
  std::shared_ptr<storage::BackendRegistry> backends_;
  std::shared_ptr<MigrationScheduler>       scheduler_;
  ExecutorOptions                           options_;

  std::mutex               lifecycle_mutex_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace datarouter::migration
