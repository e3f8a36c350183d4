#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/migration/migration_controller.hpp"
#include "internal/model/migration.hpp"
#include "operation_result.hpp"
#include "service_context.hpp"

namespace datarouter::service {

/*
  migration.* operations.
  Every call returns a structured result; nothing throws.
*/
class MigrationService {
 public:
  explicit MigrationService(ServiceContext ctx);

  OperationResult<std::vector<model::MigrationPolicy>> ListPolicies();
  OperationResult<model::MigrationPolicy>              GetPolicy(const std::string& name);
  OperationResult<model::MigrationPolicy>              CreatePolicy(const model::MigrationPolicy& policy);
  OperationResult<model::MigrationPolicy>              UpdatePolicy(const std::string& name, const model::MigrationPolicy& policy);
  OperationResult<bool>                                DeletePolicy(const std::string& name);

  // Task ids created or already active for the matched content.
  OperationResult<std::vector<std::string>> ExecutePolicy(const std::string& name);

  OperationResult<model::MigrationTask>              Start(const migration::StartRequest& request);
  OperationResult<std::vector<model::MigrationTask>> Batch(const migration::BatchRequest& request);
  OperationResult<model::MigrationBatch>             GetBatch(const std::string& batch_id);

  OperationResult<model::MigrationTask>              Get(const std::string& task_id);
  OperationResult<std::vector<model::MigrationTask>> List(const model::TaskQuery& query);
  OperationResult<model::MigrationTask>              Cancel(const std::string& task_id);
  OperationResult<model::MigrationSummary>           Summary();
  OperationResult<std::uint64_t>                     Cleanup(std::int64_t days);
  OperationResult<model::MigrationEstimate>          Estimate(const std::string& source_backend, const std::string& destination_backend,
                                                              const std::string& content_id);

 private:
  ServiceContext ctx_;
};

} // namespace datarouter::service
