#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace datarouter::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                                  InsertRule(Transaction&, const model::RoutingRuleRecord&) override;
  Result                                  UpdateRule(Transaction&, const model::RoutingRuleRecord&) override;
  Result                                  DeleteRule(Transaction&, const std::string& id) override;
  std::optional<model::RoutingRuleRecord> GetRule(Transaction&, const std::string& id) override;
  std::vector<model::RoutingRuleRecord>   ListRules(Transaction&) override;

  Result                                      InsertPolicy(Transaction&, const model::MigrationPolicyRecord&) override;
  Result                                      UpdatePolicy(Transaction&, const model::MigrationPolicyRecord&) override;
  Result                                      DeletePolicy(Transaction&, const std::string& name) override;
  std::optional<model::MigrationPolicyRecord> GetPolicy(Transaction&, const std::string& name) override;
  std::vector<model::MigrationPolicyRecord>   ListPolicies(Transaction&) override;

  Result                                     InsertBatch(Transaction&, const model::MigrationBatchRecord&) override;
  std::optional<model::MigrationBatchRecord> GetBatch(Transaction&, const std::string& batch_id) override;

  Result                                    InsertTask(Transaction&, model::MigrationTaskRecord&) override;
  Result                                    UpdateTask(Transaction&, const model::MigrationTaskRecord&) override;
  std::optional<model::MigrationTaskRecord> GetTask(Transaction&, const std::string& id) override;
  std::vector<model::MigrationTaskRecord>   ListTasks(Transaction&, const TaskFilter& filter) override;
  std::optional<model::MigrationTaskRecord> FindActiveTask(Transaction&, const std::string& source_backend,
                                                           const std::string& destination_backend, const std::string& content_id) override;
  std::optional<model::MigrationTaskRecord> NextQueuedTask(Transaction&, uint64_t now_ms) override;
  std::map<int32_t, uint64_t>               CountTasksByStatus(Transaction&) override;
  uint64_t                                  SumBytesTransferred(Transaction&) override;
  Result                                    DeleteTerminalTasks(Transaction&, uint64_t cutoff_ms, uint64_t& removed) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
};

} // namespace datarouter::db::postgres
