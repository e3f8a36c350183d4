#include "migration_service.hpp"

#include "internal/migration/migration_executor.hpp"
#include "observe.hpp"

namespace datarouter::service {

using detail::Observe;

MigrationService::MigrationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

OperationResult<std::vector<model::MigrationPolicy>> MigrationService::ListPolicies() {
  return Observe("MigrationService.ListPolicies", [&] { return ctx_.migrations->ListPolicies(); });
}

OperationResult<model::MigrationPolicy> MigrationService::GetPolicy(const std::string& name) {
  return Observe("MigrationService.GetPolicy", [&] { return ctx_.migrations->GetPolicy(name); });
}

OperationResult<model::MigrationPolicy> MigrationService::CreatePolicy(const model::MigrationPolicy& policy) {
  return Observe("MigrationService.CreatePolicy", [&] { return ctx_.migrations->CreatePolicy(policy); });
}

OperationResult<model::MigrationPolicy> MigrationService::UpdatePolicy(const std::string& name, const model::MigrationPolicy& policy) {
  return Observe("MigrationService.UpdatePolicy", [&] { return ctx_.migrations->UpdatePolicy(name, policy); });
}

OperationResult<bool> MigrationService::DeletePolicy(const std::string& name) {
  return Observe("MigrationService.DeletePolicy", [&] { return ctx_.migrations->DeletePolicy(name); });
}

OperationResult<std::vector<std::string>> MigrationService::ExecutePolicy(const std::string& name) {
  return Observe("MigrationService.ExecutePolicy", [&] { return ctx_.migrations->ExecutePolicy(name).batch.task_ids; });
}

OperationResult<model::MigrationTask> MigrationService::Start(const migration::StartRequest& request) {
  return Observe("MigrationService.Start", [&] { return ctx_.migrations->Start(request); });
}

OperationResult<std::vector<model::MigrationTask>> MigrationService::Batch(const migration::BatchRequest& request) {
  return Observe("MigrationService.Batch", [&] { return ctx_.migrations->Batch(request).tasks; });
}

OperationResult<model::MigrationBatch> MigrationService::GetBatch(const std::string& batch_id) {
  return Observe("MigrationService.GetBatch", [&] { return ctx_.migrations->GetBatch(batch_id); });
}

OperationResult<model::MigrationTask> MigrationService::Get(const std::string& task_id) {
  return Observe("MigrationService.Get", [&] { return ctx_.migrations->Get(task_id); });
}

OperationResult<std::vector<model::MigrationTask>> MigrationService::List(const model::TaskQuery& query) {
  return Observe("MigrationService.List", [&] { return ctx_.migrations->List(query); });
}

OperationResult<model::MigrationTask> MigrationService::Cancel(const std::string& task_id) {
  return Observe("MigrationService.Cancel", [&] { return ctx_.migrations->Cancel(task_id); });
}

OperationResult<model::MigrationSummary> MigrationService::Summary() {
  return Observe("MigrationService.Summary", [&] {
    auto summary             = ctx_.migrations->Summary();
    summary.executor_running = ctx_.executor && ctx_.executor->Running();
    return summary;
  });
}

OperationResult<std::uint64_t> MigrationService::Cleanup(std::int64_t days) {
  return Observe("MigrationService.Cleanup", [&] { return ctx_.migrations->Cleanup(days); });
}

OperationResult<model::MigrationEstimate> MigrationService::Estimate(const std::string& source_backend, const std::string& destination_backend,
                                                                     const std::string& content_id) {
  return Observe("MigrationService.Estimate", [&] { return ctx_.migrations->Estimate(source_backend, destination_backend, content_id); });
}

} // namespace datarouter::service
