#include "internal/migration/task_store.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using datarouter::migration::FailureOutcome;
using datarouter::migration::RetryPolicy;
using datarouter::migration::TaskStore;
using datarouter::model::MigrationStatus;
using datarouter::model::Priority;
using datarouter::model::TaskSpec;

std::unique_ptr<TaskStore> NewStore(RetryPolicy retry = {}) {
  return std::make_unique<TaskStore>(std::make_shared<datarouter::db::memory::MemoryRepository>(),
                                     std::make_shared<datarouter::migration::MigrationScheduler>(), retry);
}

TaskSpec Spec(const std::string& content_id, Priority priority = Priority::kNormal) {
  TaskSpec spec;
  spec.source_backend      = "ipfs";
  spec.destination_backend = "s3";
  spec.content_id          = content_id;
  spec.options.priority    = priority;
  return spec;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestDuplicateActiveTaskIsRejected() {
  auto store = NewStore();
  auto first = store->Create(Spec("c1"));
  assert(first.status == MigrationStatus::kQueued);

  assert(Throws<datarouter::util::DuplicateTask>([&] { store->Create(Spec("c1")); }));

  // still a duplicate while in progress
  auto claimed = store->ClaimNext();
  assert(claimed && claimed->id == first.id);
  assert(claimed->status == MigrationStatus::kInProgress && claimed->started_at);
  assert(Throws<datarouter::util::DuplicateTask>([&] { store->Create(Spec("c1")); }));

  // a different tuple is independent
  auto other                = Spec("c1");
  other.destination_backend = "filecoin";
  store->Create(other);

  // terminal tasks free the tuple
  assert(store->MarkCompleted(first.id, "c1", 10));
  auto again = store->Create(Spec("c1"));
  assert(again.id != first.id);
}

void TestClaimOrderIsPriorityThenFifo() {
  auto store  = NewStore();
  auto low   = store->Create(Spec("low", Priority::kLow));
  auto n1    = store->Create(Spec("n1"));
  auto crit  = store->Create(Spec("crit", Priority::kCritical));
  auto n2    = store->Create(Spec("n2"));
  auto high  = store->Create(Spec("high", Priority::kHigh));

  const std::vector<std::string> expected = {crit.id, high.id, n1.id, n2.id, low.id};
  for (const auto& id : expected) {
    auto task = store->ClaimNext();
    assert(task && task->id == id);
  }
  assert(!store->ClaimNext());
}

void TestCancelRules() {
  auto store     = NewStore();
  auto queued    = store->Create(Spec("a"));
  auto cancelled = store->Cancel(queued.id);
  assert(cancelled.status == MigrationStatus::kCancelled);
  assert(cancelled.completed_at);
  assert(store->IsCancelled(queued.id));

  assert(Throws<datarouter::util::InvalidState>([&] { store->Cancel(queued.id); }));
  assert(Throws<datarouter::util::NotFound>([&] { store->Cancel("missing"); }));

  // in-progress cancel wins over a late completion
  auto running = store->Create(Spec("b"));
  assert(store->ClaimNext()->id == running.id);
  store->Cancel(running.id);
  assert(!store->MarkCompleted(running.id, "b", 5));
  assert(store->RecordFailure(running.id, "late error") == FailureOutcome::kIgnored);
  assert(store->Get(running.id)->status == MigrationStatus::kCancelled);

  auto done = store->Create(Spec("c"));
  store->ClaimNext();
  assert(store->MarkCompleted(done.id, "c", 7));
  assert(Throws<datarouter::util::InvalidState>([&] { store->Cancel(done.id); }));
}

void TestMarkCompletedRequiresInProgress() {
  auto store = NewStore();
  auto task  = store->Create(Spec("q"));
  assert(!store->MarkCompleted(task.id, "q", 1));
  assert(!store->MarkCompleted("missing", "q", 1));

  store->ClaimNext();
  assert(store->MarkCompleted(task.id, "dest-q", 42));
  auto done = store->Get(task.id);
  assert(done->status == MigrationStatus::kCompleted);
  assert(done->destination_content_id == "dest-q");
  assert(done->bytes_transferred == 42);
  assert(done->completed_at);
  assert(!store->MarkCompleted(task.id, "dest-q", 42));
  assert(store->TotalBytesMigrated() == 42);
}

void TestRetryBackoffThenFailure() {
  RetryPolicy retry;
  retry.max_retries = 2;
  retry.base_delay  = std::chrono::milliseconds(40);
  auto store        = NewStore(retry);

  auto task = store->Create(Spec("flaky"));
  assert(store->ClaimNext());

  assert(store->RecordFailure(task.id, "timeout 1") == FailureOutcome::kRequeued);
  auto requeued = store->Get(task.id);
  assert(requeued->status == MigrationStatus::kQueued);
  assert(requeued->retry_count == 1);
  assert(requeued->error == "timeout 1");
  assert(requeued->eligible_at >= requeued->created_at + std::chrono::milliseconds(40));

  // not claimable until the backoff elapses
  assert(!store->ClaimNext());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  assert(store->ClaimNext());

  assert(store->RecordFailure(task.id, "timeout 2") == FailureOutcome::kRequeued);
  auto second = store->Get(task.id);
  assert(second->retry_count == 2);
  // second delay doubles
  assert(!store->ClaimNext());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(store->ClaimNext());

  assert(store->RecordFailure(task.id, "timeout 3") == FailureOutcome::kFailed);
  auto failed = store->Get(task.id);
  assert(failed->status == MigrationStatus::kFailed);
  assert(failed->retry_count == 2);
  assert(failed->error == "timeout 3");
  assert(failed->completed_at);
}

void TestCleanupZeroDaysKeepsActiveTasks() {
  auto store = NewStore();

  auto done = store->Create(Spec("done"));
  store->ClaimNext();
  store->MarkCompleted(done.id, "done", 1);

  auto cancelled = store->Create(Spec("cancelled"));
  store->Cancel(cancelled.id);

  auto running = store->Create(Spec("running", Priority::kCritical));
  assert(store->ClaimNext()->id == running.id);
  auto queued = store->Create(Spec("queued"));

  assert(Throws<datarouter::util::ValidationError>([&] { store->CleanupOlderThan(-1); }));

  // nothing is older than a week yet
  assert(store->CleanupOlderThan(7) == 0);

  assert(store->CleanupOlderThan(0) == 2);
  assert(!store->Get(done.id));
  assert(!store->Get(cancelled.id));
  assert(store->Get(running.id)->status == MigrationStatus::kInProgress);
  assert(store->Get(queued.id)->status == MigrationStatus::kQueued);
}

void TestCleanupWithLongRetentionKeepsRecentTasks() {
  auto store     = NewStore();
  auto cancelled = store->Create(Spec("recent"));
  store->Cancel(cancelled.id);

  // retention windows past the epoch clamp instead of wrapping into the future
  assert(store->CleanupOlderThan(200000) == 0);
  assert(store->CleanupOlderThan(std::numeric_limits<std::int64_t>::max()) == 0);
  assert(store->Get(cancelled.id)->status == MigrationStatus::kCancelled);
}

void TestCountsReconcileWithTasks() {
  auto store = NewStore();
  for (int i = 0; i < 6; ++i)
    store->Create(Spec("item-" + std::to_string(i)));

  auto a = store->ClaimNext();
  store->MarkCompleted(a->id, a->content_id, 3);
  auto b = store->ClaimNext();
  store->RecordFailure(b->id, "boom");
  auto c = store->ClaimNext();
  store->Cancel(c->id);
  store->CleanupOlderThan(0);
  store->Create(Spec("late"));

  datarouter::model::TaskQuery all;
  all.limit = 0;
  const auto tasks  = store->List(all);
  const auto counts = store->CountByStatus();
  assert(counts.size() == 5);

  const auto total = std::accumulate(counts.begin(), counts.end(), std::uint64_t{0}, [](auto sum, const auto& kv) { return sum + kv.second; });
  assert(total == tasks.size());

  for (auto status : datarouter::model::kAllStatuses) {
    std::uint64_t n = 0;
    for (const auto& t : tasks) {
      if (t.status == status) ++n;
    }
    assert(counts.at(status) == n);
  }
}

void TestListFiltersAndPaging() {
  auto store = NewStore();
  for (int i = 0; i < 5; ++i)
    store->Create(Spec("p" + std::to_string(i)));
  auto other                = Spec("x");
  other.destination_backend = "filecoin";
  store->Create(other);

  datarouter::model::TaskQuery query;
  query.destination_backend = "s3";
  auto s3 = store->List(query);
  assert(s3.size() == 5);
  // newest first
  assert(s3.front().content_id == "p4" && s3.back().content_id == "p0");

  query.limit  = 2;
  query.offset = 1;
  auto page    = store->List(query);
  assert(page.size() == 2 && page.front().content_id == "p3");

  datarouter::model::TaskQuery by_status;
  by_status.status = MigrationStatus::kInProgress;
  assert(store->List(by_status).empty());
}

void TestBatchDedupesAgainstActiveTasks() {
  auto store    = NewStore();
  auto existing = store->Create(Spec("b"));

  std::vector<TaskSpec> specs = {Spec("a"), Spec("b"), Spec("c")};
  auto                  out   = store->CreateBatch("nightly", specs);
  assert(out.created == 2);
  assert(out.tasks.size() == 3);
  assert(out.tasks[1].id == existing.id);
  assert(out.tasks[0].batch_id == out.batch.batch_id);
  assert(out.tasks[0].policy_name == "nightly");

  auto batch = store->GetBatch(out.batch.batch_id);
  assert(batch && batch->policy_name == "nightly");
  assert(batch->task_ids.size() == 3);
  assert(batch->task_ids[1] == existing.id);
  assert(!store->GetBatch("missing"));

  datarouter::model::TaskQuery query;
  query.batch_id = out.batch.batch_id;
  assert(store->List(query).size() == 2);
}

void TestInterruptedTasksAreRequeued() {
  auto store = NewStore();
  auto task  = store->Create(Spec("r"));
  store->ClaimNext();

  assert(store->RequeueInterrupted() == 1);
  auto requeued = store->Get(task.id);
  assert(requeued->status == MigrationStatus::kQueued);
  assert(!requeued->started_at);
  assert(store->ClaimNext()->id == task.id);
}

} // namespace

int main() {
  TestDuplicateActiveTaskIsRejected();
  TestClaimOrderIsPriorityThenFifo();
  TestCancelRules();
  TestMarkCompletedRequiresInProgress();
  TestRetryBackoffThenFailure();
  TestCleanupZeroDaysKeepsActiveTasks();
  TestCleanupWithLongRetentionKeepsRecentTasks();
  TestCountsReconcileWithTasks();
  TestListFiltersAndPaging();
  TestBatchDedupesAgainstActiveTasks();
  TestInterruptedTasksAreRequeued();

  std::cout << "datarouter_unit_task_store: pass\n";
  return 0;
}
