#include "internal/migration/migration_executor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/fake_backend_store.hpp"
#include "tests/support/flaky_repository.hpp"

namespace {

using datarouter::migration::ExecutorOptions;
using datarouter::migration::MigrationExecutor;
using datarouter::migration::MigrationScheduler;
using datarouter::migration::ProcessOutcome;
using datarouter::migration::RetryPolicy;
using datarouter::migration::TaskStore;
using datarouter::model::MigrationStatus;
using datarouter::model::TaskSpec;
using datarouter::testing::FakeBackendStore;

/*
  Destination that cancels the task while its write is in flight.
*/
class CancellingStore final : public datarouter::storage::BackendStore {
 public:
  CancellingStore(std::shared_ptr<FakeBackendStore> inner, std::shared_ptr<TaskStore> tasks) : inner_(std::move(inner)), tasks_(std::move(tasks)) {
  }

  std::string Add(const std::string& content, const datarouter::model::Metadata& metadata) override {
    tasks_->Cancel(metadata.at("migration_task"));
    return inner_->Add(content, metadata);
  }
  std::string Get(const std::string& content_id) override {
    return inner_->Get(content_id);
  }
  datarouter::model::Metadata GetMetadata(const std::string& content_id) override {
    return inner_->GetMetadata(content_id);
  }
  datarouter::storage::ContentItem Describe(const std::string& content_id) override {
    return inner_->Describe(content_id);
  }
  std::vector<datarouter::storage::ContentItem> List(const datarouter::model::ContentFilter& filter) override {
    return inner_->List(filter);
  }
  bool Delete(const std::string& content_id) override {
    return inner_->Delete(content_id);
  }
  const std::string& Name() const override {
    return inner_->Name();
  }

 private:
  std::shared_ptr<FakeBackendStore> inner_;
  std::shared_ptr<TaskStore>        tasks_;
};

struct Fixture {
  std::shared_ptr<MigrationScheduler>                   scheduler = std::make_shared<MigrationScheduler>();
  std::shared_ptr<TaskStore>                            tasks;
  std::shared_ptr<datarouter::storage::BackendRegistry> backends = std::make_shared<datarouter::storage::BackendRegistry>();
  std::shared_ptr<FakeBackendStore>                     src      = std::make_shared<FakeBackendStore>("ipfs");
  std::shared_ptr<FakeBackendStore>                     dst      = std::make_shared<FakeBackendStore>("s3");
  std::unique_ptr<MigrationExecutor>                    executor;

  explicit Fixture(ExecutorOptions options = {2, std::chrono::milliseconds(10)},
                   std::shared_ptr<datarouter::db::Repository> repository = std::make_shared<datarouter::db::memory::MemoryRepository>()) {
    tasks = std::make_shared<TaskStore>(std::move(repository), scheduler, RetryPolicy{2, std::chrono::milliseconds(20)});
    backends->Register(src);
    backends->Register(dst);
    executor = std::make_unique<MigrationExecutor>(tasks, backends, scheduler, options);
  }

  datarouter::model::MigrationTask Queue(const std::string& content_id, bool delete_source = false, bool verify = false) {
    TaskSpec spec;
    spec.source_backend            = "ipfs";
    spec.destination_backend       = "s3";
    spec.content_id                = content_id;
    spec.options.delete_source     = delete_source;
    spec.options.verify_integrity  = verify;
    return tasks->Create(spec);
  }

  datarouter::model::MigrationTask Claim() {
    auto task = tasks->ClaimNext();
    assert(task);
    return *task;
  }
};

void TestCopiesContentWithMigratedMetadata() {
  Fixture f;
  f.src->Put("cid", "payload", {{"content_type", "text/plain"}, {"owner", "ops"}});
  auto queued = f.Queue("cid");

  assert(f.executor->RunOnce());
  assert(!f.executor->RunOnce());

  auto task = f.tasks->Get(queued.id);
  assert(task->status == MigrationStatus::kCompleted);
  assert(task->bytes_transferred == 7);
  assert(task->destination_content_id == "cid");
  assert(task->completed_at && task->started_at);
  assert(task->error.empty());

  assert(f.dst->Get("cid") == "payload");
  auto metadata = f.dst->MetadataOf("cid");
  assert(metadata.at("owner") == "ops");
  assert(metadata.at("content_type") == "text/plain");
  assert(metadata.at("migrated_from") == "ipfs");
  assert(metadata.at("migration_task") == queued.id);
  assert(!metadata.at("migration_time").empty());

  // source is kept unless asked otherwise
  assert(f.src->Has("cid"));
}

void TestRetriesThenFails() {
  Fixture f;
  auto    queued = f.Queue("missing");

  assert(f.executor->Process(f.Claim()) == ProcessOutcome::kRetried);
  auto task = f.tasks->Get(queued.id);
  assert(task->status == MigrationStatus::kQueued);
  assert(task->retry_count == 1);
  assert(!task->error.empty());

  // backoff holds the task back
  assert(!f.executor->RunOnce());

  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  assert(f.executor->Process(f.Claim()) == ProcessOutcome::kRetried);

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  assert(f.executor->Process(f.Claim()) == ProcessOutcome::kFailed);

  task = f.tasks->Get(queued.id);
  assert(task->status == MigrationStatus::kFailed);
  assert(task->retry_count == 2);
  assert(task->completed_at);
  assert(f.dst->adds == 0);
}

void TestTransientFailureRecovers() {
  Fixture f;
  f.src->Put("cid", "abc");
  f.dst->fail_adds = 1;
  auto queued      = f.Queue("cid");

  assert(f.executor->Process(f.Claim()) == ProcessOutcome::kRetried);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  assert(f.executor->RunOnce());

  auto task = f.tasks->Get(queued.id);
  assert(task->status == MigrationStatus::kCompleted);
  assert(task->retry_count == 1);
  assert(task->error.empty());
}

void TestCancelledBeforeWriteIsSkipped() {
  Fixture f;
  f.src->Put("cid", "abc");
  f.Queue("cid");

  auto claimed = f.Claim();
  f.tasks->Cancel(claimed.id);

  assert(f.executor->Process(claimed) == ProcessOutcome::kSkipped);
  assert(f.dst->adds == 0);
  assert(f.tasks->Get(claimed.id)->status == MigrationStatus::kCancelled);
}

void TestLateCompletionIsIgnored() {
  Fixture f;
  auto    inner = std::make_shared<FakeBackendStore>("s3");
  f.backends->Register(std::make_shared<CancellingStore>(inner, f.tasks));
  f.src->Put("cid", "abc");
  f.Queue("cid", true);

  auto claimed = f.Claim();
  assert(f.executor->Process(claimed) == ProcessOutcome::kSkipped);

  // the bytes landed but the task stays cancelled and the source survives
  assert(inner->Has("cid"));
  auto task = f.tasks->Get(claimed.id);
  assert(task->status == MigrationStatus::kCancelled);
  assert(task->destination_content_id.empty());
  assert(f.src->Has("cid"));
}

void TestDeleteSource() {
  Fixture f;
  f.src->Put("a", "1");
  f.src->Put("b", "2");
  auto a = f.Queue("a", true);
  auto b = f.Queue("b", true);

  assert(f.executor->RunOnce());
  assert(!f.src->Has("a"));

  // a failed delete is not a failed migration
  f.src->fail_deletes = true;
  assert(f.executor->RunOnce());
  assert(f.src->Has("b"));

  assert(f.tasks->Get(a.id)->status == MigrationStatus::kCompleted);
  assert(f.tasks->Get(b.id)->status == MigrationStatus::kCompleted);
}

void TestIntegrityMismatchRetries() {
  Fixture f;
  f.src->Put("cid", "abc");
  f.dst->corrupt_adds = true;
  auto queued         = f.Queue("cid", false, true);

  assert(f.executor->Process(f.Claim()) == ProcessOutcome::kRetried);
  auto task = f.tasks->Get(queued.id);
  assert(task->status == MigrationStatus::kQueued);
  assert(task->error.find("integrity") != std::string::npos);

  f.dst->corrupt_adds = false;
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  assert(f.executor->RunOnce());
  assert(f.tasks->Get(queued.id)->status == MigrationStatus::kCompleted);
  assert(f.dst->Get("cid") == "abc");
}

void TestWorkersDrainQueue() {
  Fixture f({3, std::chrono::milliseconds(10)});

  for (int i = 0; i < 20; ++i) {
    const auto id = "item-" + std::to_string(i);
    f.src->Put(id, id);
  }

  // left in progress by an earlier run
  f.Queue("item-0");
  auto interrupted = f.Claim();

  f.executor->Start();
  assert(f.executor->Running());
  for (int i = 1; i < 20; ++i)
    f.Queue("item-" + std::to_string(i));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (f.tasks->CountByStatus().at(MigrationStatus::kCompleted) < 20 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

  f.executor->Stop();
  assert(!f.executor->Running());

  assert(f.tasks->CountByStatus().at(MigrationStatus::kCompleted) == 20);
  assert(f.tasks->Get(interrupted.id)->status == MigrationStatus::kCompleted);
  assert(f.dst->adds == 20);

  // restartable
  f.src->Put("late", "x");
  f.executor->Start();
  f.Queue("late");
  const auto second = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!f.dst->Has("late") && std::chrono::steady_clock::now() < second)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  f.executor->Stop();
  assert(f.dst->Has("late"));
}

} // namespace

ExecutorOptions QuickStateRetries() {
  ExecutorOptions options;
  options.workers              = 1;
  options.poll_interval        = std::chrono::milliseconds(10);
  options.state_write_attempts = 3;
  options.state_write_backoff  = std::chrono::milliseconds(1);
  return options;
}

void TestCompletionWriteIsRetried() {
  auto    repository = std::make_shared<datarouter::testing::FlakyRepository>();
  Fixture f(QuickStateRetries(), repository);
  f.src->Put("cid", "abc");
  auto queued = f.Queue("cid");
  auto task   = f.Claim();

  repository->fail_task_updates = 2;
  assert(f.executor->Process(task) == ProcessOutcome::kCompleted);
  assert(repository->failed_task_updates == 2);

  auto done = f.tasks->Get(queued.id);
  assert(done->status == MigrationStatus::kCompleted);
  assert(done->bytes_transferred == 3);
}

void TestFailureWriteIsRetried() {
  auto    repository = std::make_shared<datarouter::testing::FlakyRepository>();
  Fixture f(QuickStateRetries(), repository);
  auto    queued = f.Queue("missing");
  auto    task   = f.Claim();

  repository->fail_task_updates = 1;
  assert(f.executor->Process(task) == ProcessOutcome::kRetried);

  auto requeued = f.tasks->Get(queued.id);
  assert(requeued->status == MigrationStatus::kQueued);
  assert(requeued->retry_count == 1);
}

void TestExhaustedStateWritesLeaveTaskForRequeue() {
  auto    repository = std::make_shared<datarouter::testing::FlakyRepository>();
  Fixture f(QuickStateRetries(), repository);
  f.src->Put("cid", "abc");
  auto queued = f.Queue("cid");
  auto task   = f.Claim();

  repository->fail_task_updates = 3;
  bool threw                    = false;
  try {
    f.executor->Process(task);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(repository->failed_task_updates == 3);
  assert(f.tasks->Get(queued.id)->status == MigrationStatus::kInProgress);

  // the next start picks it up again
  f.executor->Start();
  for (int i = 0; i < 200 && f.tasks->Get(queued.id)->status != MigrationStatus::kCompleted; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  f.executor->Stop();
  assert(f.tasks->Get(queued.id)->status == MigrationStatus::kCompleted);
}

int main() {
  TestCopiesContentWithMigratedMetadata();
  TestRetriesThenFails();
  TestTransientFailureRecovers();
  TestCancelledBeforeWriteIsSkipped();
  TestLateCompletionIsIgnored();
  TestDeleteSource();
  TestIntegrityMismatchRetries();
  TestWorkersDrainQueue();
  TestCompletionWriteIsRetried();
  TestFailureWriteIsRetried();
  TestExhaustedStateWritesLeaveTaskForRequeue();

  std::cout << "datarouter_unit_migration_executor: pass\n";
  return 0;
}
