#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/metrics/backend_metrics_store.hpp"
#include "internal/model/migration.hpp"
#include "internal/storage/backend_registry.hpp"
#include "policy_store.hpp"
#include "task_store.hpp"

namespace datarouter::migration {

struct StartRequest {
  std::string       source_backend;
  std::string       destination_backend;
  std::string       content_id;
  model::TaskOptions options;
};

struct BatchRequest {
  std::string              source_backend;
  std::string              destination_backend;
  std::vector<std::string> content_ids;
  model::TaskOptions       options;
};

/*
  Migration control plane.

  Owns nothing but references: tasks and policies live in their stores,
  content lives in the registered backends. Transfers are done by
  MigrationExecutor.
*/
class MigrationController {
 public:
  MigrationController(std::shared_ptr<TaskStore> tasks, std::shared_ptr<PolicyStore> policies, std::shared_ptr<storage::BackendRegistry> backends,
                      std::shared_ptr<metrics::BackendMetricsStore> metrics);

  // ------------------------------------------------------------------
  // Tasks
  // ------------------------------------------------------------------
  // Throws util::DuplicateTask when the tuple already has an active task.
  model::MigrationTask Start(const StartRequest& request);

  // Active duplicates are returned as they are, not recreated.
  BatchOutcome Batch(const BatchRequest& request);

  // One task per matching source item, grouped in a new batch.
  BatchOutcome ExecutePolicy(const std::string& policy_name);

  // Throws util::NotFound.
  model::MigrationTask Get(const std::string& task_id);

  std::vector<model::MigrationTask> List(const model::TaskQuery& query);

  // Throws util::NotFound, util::InvalidState.
  model::MigrationTask Cancel(const std::string& task_id);

  // executor_running is left false; the caller owns the executor.
  model::MigrationSummary Summary();

  std::uint64_t Cleanup(std::int64_t days);

  model::MigrationEstimate Estimate(const std::string& source_backend, const std::string& destination_backend, const std::string& content_id);

  // Throws util::NotFound.
  model::MigrationBatch GetBatch(const std::string& batch_id);

  // ------------------------------------------------------------------
  // Policies
  // ------------------------------------------------------------------
  model::MigrationPolicy              CreatePolicy(model::MigrationPolicy policy);
  model::MigrationPolicy              UpdatePolicy(const std::string& name, model::MigrationPolicy policy);
  bool                                DeletePolicy(const std::string& name);
  model::MigrationPolicy              GetPolicy(const std::string& name);
  std::vector<model::MigrationPolicy> ListPolicies();

 private:
  void RequireRoute(const std::string& source_backend, const std::string& destination_backend) const;

  std::shared_ptr<TaskStore>                    tasks_;
  std::shared_ptr<PolicyStore>                  policies_;
  std::shared_ptr<storage::BackendRegistry>     backends_;
  std::shared_ptr<metrics::BackendMetricsStore> metrics_;
};

} // namespace datarouter::migration
