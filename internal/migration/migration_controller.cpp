#include "migration_controller.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datarouter::migration {

using observability::IntField;
using observability::StringField;

namespace {

constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

} // namespace

MigrationController::MigrationController(std::shared_ptr<TaskStore> tasks, std::shared_ptr<PolicyStore> policies,
                                         std::shared_ptr<storage::BackendRegistry> backends, std::shared_ptr<metrics::BackendMetricsStore> metrics)
    : tasks_(std::move(tasks)), policies_(std::move(policies)), backends_(std::move(backends)), metrics_(std::move(metrics)) {
}

void MigrationController::RequireRoute(const std::string& source_backend, const std::string& destination_backend) const {
  if (source_backend.empty() || destination_backend.empty()) {
    throw util::ValidationError("source and destination backend are required");
  }
  if (source_backend == destination_backend) throw util::ValidationError("source and destination backend must differ");
  if (!backends_->Contains(source_backend)) throw util::NotFound("backend not found: " + source_backend);
  if (!backends_->Contains(destination_backend)) throw util::NotFound("backend not found: " + destination_backend);
}

model::MigrationTask MigrationController::Start(const StartRequest& request) {
  RequireRoute(request.source_backend, request.destination_backend);
  if (request.content_id.empty()) throw util::ValidationError("content_id is required");
  if (!model::IsValid(request.options.priority)) throw util::ValidationError("priority out of range");

  model::TaskSpec spec;
  spec.source_backend      = request.source_backend;
  spec.destination_backend = request.destination_backend;
  spec.content_id          = request.content_id;
  spec.options             = request.options;
  return tasks_->Create(spec);
}

BatchOutcome MigrationController::Batch(const BatchRequest& request) {
  RequireRoute(request.source_backend, request.destination_backend);
  if (request.content_ids.empty()) throw util::ValidationError("content_ids must not be empty");
  if (!model::IsValid(request.options.priority)) throw util::ValidationError("priority out of range");

  std::vector<model::TaskSpec> specs;
  specs.reserve(request.content_ids.size());
  for (const auto& content_id : request.content_ids) {
    if (content_id.empty()) throw util::ValidationError("content_ids must not contain empty ids");
    // repeated ids within one request collapse to one task
    const bool seen = std::any_of(specs.begin(), specs.end(), [&](const model::TaskSpec& s) { return s.content_id == content_id; });
    if (seen) continue;

    model::TaskSpec spec;
    spec.source_backend      = request.source_backend;
    spec.destination_backend = request.destination_backend;
    spec.content_id          = content_id;
    spec.options             = request.options;
    specs.push_back(std::move(spec));
  }
  return tasks_->CreateBatch("", specs);
}

BatchOutcome MigrationController::ExecutePolicy(const std::string& policy_name) {
  const auto policy = GetPolicy(policy_name);
  if (!policy.enabled) throw util::InvalidState("policy is disabled: " + policy_name);
  RequireRoute(policy.source_backend, policy.destination_backend);

  auto source = backends_->Get(policy.source_backend);
  auto items  = source->List(policy.content_filter);

  model::TaskOptions options;
  options.priority         = policy.priority;
  options.delete_source    = policy.delete_source;
  options.verify_integrity = policy.verify_integrity;

  std::vector<model::TaskSpec> specs;
  specs.reserve(items.size());
  for (const auto& item : items) {
    model::TaskSpec spec;
    spec.source_backend      = policy.source_backend;
    spec.destination_backend = policy.destination_backend;
    spec.content_id          = item.content_id;
    spec.options             = options;
    specs.push_back(std::move(spec));
  }

  auto outcome = tasks_->CreateBatch(policy_name, specs);
  policies_->RecordRun(policy_name, outcome.created);

  DATAROUTER_LOG_INFO("Policy run queued migrations", {StringField("policy", policy_name), IntField("matched", static_cast<int64_t>(items.size())),
                                                       IntField("created", static_cast<int64_t>(outcome.created))});
  return outcome;
}

model::MigrationTask MigrationController::Get(const std::string& task_id) {
  auto task = tasks_->Get(task_id);
  if (!task) throw util::NotFound("migration not found: " + task_id);
  return *task;
}

std::vector<model::MigrationTask> MigrationController::List(const model::TaskQuery& query) {
  return tasks_->List(query);
}

model::MigrationTask MigrationController::Cancel(const std::string& task_id) {
  return tasks_->Cancel(task_id);
}

model::MigrationSummary MigrationController::Summary() {
  model::MigrationSummary summary;
  summary.counts = tasks_->CountByStatus();
  for (const auto& [_, count] : summary.counts)
    summary.total_tasks += count;
  summary.total_bytes_migrated = tasks_->TotalBytesMigrated();
  return summary;
}

std::uint64_t MigrationController::Cleanup(std::int64_t days) {
  return tasks_->CleanupOlderThan(days);
}

model::MigrationEstimate MigrationController::Estimate(const std::string& source_backend, const std::string& destination_backend,
                                                       const std::string& content_id) {
  RequireRoute(source_backend, destination_backend);
  if (content_id.empty()) throw util::ValidationError("content_id is required");

  const auto src = metrics_->Get(source_backend);
  const auto dst = metrics_->Get(destination_backend);

  model::MigrationEstimate estimate;
  estimate.size_bytes = backends_->Get(source_backend)->Describe(content_id).size_bytes;

  const double gb = static_cast<double>(estimate.size_bytes) / kBytesPerGb;
  estimate.transfer_cost                    = gb * (src.retrieval_cost_per_gb + src.bandwidth_cost_per_gb);
  estimate.destination_monthly_storage_cost = gb * dst.storage_cost_per_gb;

  // throughput is in megabits per second
  const double mbps = std::min(src.throughput_mbps, dst.throughput_mbps);
  if (mbps > 0.0) {
    const double bits          = static_cast<double>(estimate.size_bytes) * 8.0;
    estimate.estimated_seconds = bits / (mbps * 1e6) + (src.avg_latency_ms + dst.avg_latency_ms) / 1000.0;
  }
  return estimate;
}

model::MigrationBatch MigrationController::GetBatch(const std::string& batch_id) {
  auto batch = tasks_->GetBatch(batch_id);
  if (!batch) throw util::NotFound("batch not found: " + batch_id);
  return *batch;
}

model::MigrationPolicy MigrationController::CreatePolicy(model::MigrationPolicy policy) {
  return policies_->Create(std::move(policy));
}

model::MigrationPolicy MigrationController::UpdatePolicy(const std::string& name, model::MigrationPolicy policy) {
  return policies_->Update(name, std::move(policy));
}

bool MigrationController::DeletePolicy(const std::string& name) {
  return policies_->Delete(name);
}

model::MigrationPolicy MigrationController::GetPolicy(const std::string& name) {
  auto policy = policies_->Get(name);
  if (!policy) throw util::NotFound("policy not found: " + name);
  return *policy;
}

std::vector<model::MigrationPolicy> MigrationController::ListPolicies() {
  return policies_->List();
}

} // namespace datarouter::migration
