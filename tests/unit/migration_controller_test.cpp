#include "internal/migration/migration_controller.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_backend_store.hpp"

namespace {

using datarouter::migration::BatchRequest;
using datarouter::migration::MigrationController;
using datarouter::migration::StartRequest;
using datarouter::model::MigrationPolicy;
using datarouter::model::MigrationStatus;
using datarouter::model::ScheduleMode;
using datarouter::testing::FakeBackendStore;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct Fixture {
  std::shared_ptr<datarouter::db::Repository>               repository = std::make_shared<datarouter::db::memory::MemoryRepository>();
  std::shared_ptr<datarouter::migration::TaskStore>         tasks;
  std::shared_ptr<datarouter::metrics::BackendMetricsStore> metrics  = std::make_shared<datarouter::metrics::BackendMetricsStore>();
  std::shared_ptr<datarouter::storage::BackendRegistry>     backends = std::make_shared<datarouter::storage::BackendRegistry>();
  std::shared_ptr<FakeBackendStore>                         ipfs     = std::make_shared<FakeBackendStore>("ipfs");
  std::shared_ptr<FakeBackendStore>                         s3       = std::make_shared<FakeBackendStore>("s3");
  std::unique_ptr<MigrationController>                      controller;

  Fixture() {
    tasks = std::make_shared<datarouter::migration::TaskStore>(repository, nullptr);
    backends->Register(ipfs);
    backends->Register(s3);
    controller = std::make_unique<MigrationController>(tasks, std::make_shared<datarouter::migration::PolicyStore>(repository), backends, metrics);
  }
};

MigrationPolicy Policy(const std::string& name) {
  MigrationPolicy policy;
  policy.name                = name;
  policy.source_backend      = "ipfs";
  policy.destination_backend = "s3";
  return policy;
}

void TestExecutePolicySelectsPrefixSubset() {
  Fixture f;
  f.ipfs->Put("i1", "one");
  f.ipfs->Put("i2", "two");
  f.ipfs->Put("p_3", "three");

  auto policy                  = Policy("archive-p");
  policy.content_filter.prefix = "p_";
  policy.delete_source         = true;
  f.controller->CreatePolicy(policy);

  auto first = f.controller->ExecutePolicy("archive-p");
  assert(first.created == 1);
  assert(first.batch.task_ids.size() == 1);
  auto task = f.controller->Get(first.batch.task_ids.front());
  assert(task.content_id == "p_3");
  assert(task.options.delete_source);
  assert(task.policy_name == "archive-p");
  assert(task.batch_id == first.batch.batch_id);

  // re-running dedupes silently and returns the active task
  auto second = f.controller->ExecutePolicy("archive-p");
  assert(second.created == 0);
  assert(second.batch.task_ids == first.batch.task_ids);
  assert(second.batch.batch_id != first.batch.batch_id);

  auto stored = f.controller->GetPolicy("archive-p");
  assert(stored.run_count == 2);
  assert(stored.total_tasks_created == 1);
  assert(stored.last_run_at);

  assert(f.controller->GetBatch(first.batch.batch_id).task_ids == first.batch.task_ids);
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->GetBatch("nope"); }));
}

void TestExecutePolicyFiltersByTypeAndSize() {
  Fixture f;
  f.ipfs->Put("a", std::string(10, 'a'), {{"content_type", "image/png"}});
  f.ipfs->Put("b", std::string(500, 'b'), {{"content_type", "image/jpeg"}, {"tier", "cold"}});
  f.ipfs->Put("c", std::string(500, 'c'), {{"content_type", "video/mp4"}, {"tier", "cold"}});

  auto policy                          = Policy("cold-images");
  policy.content_filter.type           = "image/";
  policy.content_filter.min_size_bytes = 100;
  policy.content_filter.custom         = {{"tier", "cold"}};
  f.controller->CreatePolicy(policy);

  auto out = f.controller->ExecutePolicy("cold-images");
  assert(out.created == 1);
  assert(f.controller->Get(out.batch.task_ids.front()).content_id == "b");
}

void TestPolicyValidationAndLifecycle() {
  Fixture f;

  auto same                = Policy("same");
  same.destination_backend = "ipfs";
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->CreatePolicy(same); }));

  auto periodic     = Policy("periodic");
  periodic.schedule = ScheduleMode::kPeriodic;
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->CreatePolicy(periodic); }));

  auto inverted                          = Policy("inverted");
  inverted.content_filter.min_size_bytes = 10;
  inverted.content_filter.max_size_bytes = 1;
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->CreatePolicy(inverted); }));

  f.controller->CreatePolicy(Policy("p"));
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->CreatePolicy(Policy("p")); }));
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->UpdatePolicy("ghost", Policy("ghost")); }));
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->GetPolicy("ghost"); }));
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->ExecutePolicy("ghost"); }));

  auto disabled        = Policy("p");
  disabled.enabled     = false;
  disabled.description = "paused";
  auto updated         = f.controller->UpdatePolicy("p", disabled);
  assert(!updated.enabled && updated.description == "paused");
  assert(Throws<datarouter::util::InvalidState>([&] { f.controller->ExecutePolicy("p"); }));

  // a policy naming an unregistered backend cannot run
  auto dangling                = Policy("dangling");
  dangling.destination_backend = "arweave";
  f.controller->CreatePolicy(dangling);
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->ExecutePolicy("dangling"); }));

  assert(f.controller->ListPolicies().size() == 2);
  assert(f.controller->DeletePolicy("p"));
  assert(!f.controller->DeletePolicy("p"));
  assert(f.controller->ListPolicies().size() == 1);
}

void TestStartValidatesAndDedupes() {
  Fixture f;

  StartRequest request{"ipfs", "s3", "cid-1", {}};
  auto         task = f.controller->Start(request);
  assert(task.status == MigrationStatus::kQueued);
  assert(Throws<datarouter::util::DuplicateTask>([&] { f.controller->Start(request); }));

  assert(Throws<datarouter::util::NotFound>([&] { f.controller->Start({"ipfs", "arweave", "cid-1", {}}); }));
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->Start({"s3", "s3", "cid-1", {}}); }));
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->Start({"ipfs", "s3", "", {}}); }));
  assert(Throws<datarouter::util::NotFound>([&] { f.controller->Get("missing"); }));
}

void TestBatchCollapsesRepeatedIds() {
  Fixture f;
  f.controller->Start({"ipfs", "s3", "x", {}});

  BatchRequest request;
  request.source_backend      = "ipfs";
  request.destination_backend = "s3";
  request.content_ids         = {"x", "y", "y", "z"};

  auto out = f.controller->Batch(request);
  assert(out.tasks.size() == 3);
  assert(out.created == 2);
  assert(out.batch.policy_name.empty());

  request.content_ids.clear();
  assert(Throws<datarouter::util::ValidationError>([&] { f.controller->Batch(request); }));
}

void TestCancelAndSummary() {
  Fixture f;
  auto    queued = f.controller->Start({"ipfs", "s3", "q", {}});
  auto    done   = f.controller->Start({"ipfs", "s3", "d", {}});

  auto claimed = f.tasks->ClaimNext();
  assert(claimed && claimed->id == queued.id);
  assert(f.tasks->MarkCompleted(queued.id, "q", 9));
  assert(Throws<datarouter::util::InvalidState>([&] { f.controller->Cancel(queued.id); }));

  auto cancelled = f.controller->Cancel(done.id);
  assert(cancelled.status == MigrationStatus::kCancelled);

  f.controller->Start({"ipfs", "s3", "open", {}});

  auto summary = f.controller->Summary();
  assert(summary.total_tasks == 3);
  assert(summary.counts.at(MigrationStatus::kCompleted) == 1);
  assert(summary.counts.at(MigrationStatus::kCancelled) == 1);
  assert(summary.counts.at(MigrationStatus::kQueued) == 1);
  assert(summary.counts.at(MigrationStatus::kFailed) == 0);
  assert(summary.total_bytes_migrated == 9);
  assert(!summary.executor_running);

  assert(f.controller->Cleanup(0) == 2);
  summary = f.controller->Summary();
  assert(summary.total_tasks == 1);
  assert(f.controller->List({}).size() == 1);
}

void TestEstimate() {
  Fixture f;
  const std::string blob(1024 * 1024, 'e');
  f.ipfs->Put("big", blob);

  datarouter::model::BackendMetrics src;
  src.avg_latency_ms        = 80;
  src.throughput_mbps       = 100;
  src.retrieval_cost_per_gb = 0.01;
  src.bandwidth_cost_per_gb = 0.09;
  datarouter::model::BackendMetrics dst;
  dst.avg_latency_ms      = 20;
  dst.throughput_mbps     = 50;
  dst.storage_cost_per_gb = 0.023;

  assert(Throws<datarouter::util::NotFound>([&] { f.controller->Estimate("ipfs", "s3", "big"); }));

  f.metrics->Update("ipfs", src);
  f.metrics->Update("s3", dst);

  auto estimate = f.controller->Estimate("ipfs", "s3", "big");
  assert(estimate.size_bytes == blob.size());
  // sized without reading the bytes
  assert(f.ipfs->gets == 0);

  const double gb = 1.0 / 1024.0;
  assert(std::abs(estimate.transfer_cost - gb * 0.10) < 1e-12);
  assert(std::abs(estimate.destination_monthly_storage_cost - gb * 0.023) < 1e-12);

  const double expected_seconds = (1024.0 * 1024.0 * 8.0) / (50.0 * 1e6) + 0.1;
  assert(estimate.estimated_seconds);
  assert(std::abs(*estimate.estimated_seconds - expected_seconds) < 1e-9);

  // estimates never create tasks
  assert(f.controller->Summary().total_tasks == 0);

  dst.throughput_mbps = 0;
  f.metrics->Update("s3", dst);
  assert(!f.controller->Estimate("ipfs", "s3", "big").estimated_seconds);

  assert(Throws<datarouter::util::NotFound>([&] { f.controller->Estimate("ipfs", "s3", "absent"); }));
}

} // namespace

int main() {
  TestExecutePolicySelectsPrefixSubset();
  TestExecutePolicyFiltersByTypeAndSize();
  TestPolicyValidationAndLifecycle();
  TestStartValidatesAndDedupes();
  TestBatchCollapsesRepeatedIds();
  TestCancelAndSummary();
  TestEstimate();

  std::cout << "datarouter_unit_migration_controller: pass\n";
  return 0;
}
