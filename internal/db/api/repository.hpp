#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/migration_batch_record.hpp"
#include "internal/db/model/migration_policy_record.hpp"
#include "internal/db/model/migration_task_record.hpp"
#include "internal/db/model/routing_rule_record.hpp"

namespace datarouter::db {

struct TaskFilter {
  std::optional<int32_t>     status;
  std::optional<std::string> source_backend;
  std::optional<std::string> destination_backend;
  std::optional<std::string> batch_id;
  std::optional<std::string> policy_name;
  uint64_t                   limit  = 0; // 0 = unlimited
  uint64_t                   offset = 0;
};

// Status codes stored in migration_tasks.status.
inline constexpr int32_t kTaskQueued     = 0;
inline constexpr int32_t kTaskInProgress = 1;

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - InsertTask fails with ConstraintViolation if a queued or in-progress
    task already exists for the same (source, destination, content_id)

  The DB is the source of truth for:
    routing rules
    migration policies
    migration batches and tasks
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Routing rules
  // ---------------------------------------------------------------------

  virtual Result InsertRule(Transaction&, const model::RoutingRuleRecord&) = 0;

  virtual Result UpdateRule(Transaction&, const model::RoutingRuleRecord&) = 0;

  virtual Result DeleteRule(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::RoutingRuleRecord> GetRule(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::RoutingRuleRecord> ListRules(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Migration policies
  // ---------------------------------------------------------------------

  virtual Result InsertPolicy(Transaction&, const model::MigrationPolicyRecord&) = 0;

  virtual Result UpdatePolicy(Transaction&, const model::MigrationPolicyRecord&) = 0;

  virtual Result DeletePolicy(Transaction&, const std::string& name) = 0;

  virtual std::optional<model::MigrationPolicyRecord> GetPolicy(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::MigrationPolicyRecord> ListPolicies(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Migration batches
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::MigrationBatchRecord&) = 0;

  virtual std::optional<model::MigrationBatchRecord> GetBatch(Transaction&, const std::string& batch_id) = 0;

  // ---------------------------------------------------------------------
  // Migration tasks
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result InsertTask(Transaction&, model::MigrationTaskRecord&) = 0;

  virtual Result UpdateTask(Transaction&, const model::MigrationTaskRecord&) = 0;

  virtual std::optional<model::MigrationTaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Newest first (created_at desc, seq desc).
  virtual std::vector<model::MigrationTaskRecord> ListTasks(Transaction&, const TaskFilter& filter) = 0;

  // The queued or in-progress task for the tuple, if any.
  virtual std::optional<model::MigrationTaskRecord> FindActiveTask(Transaction&, const std::string& source_backend,
                                                                   const std::string& destination_backend, const std::string& content_id) = 0;

  // Highest priority queued task with eligible_at_ms <= now_ms; ties by seq.
  virtual std::optional<model::MigrationTaskRecord> NextQueuedTask(Transaction&, uint64_t now_ms) = 0;

  virtual std::map<int32_t, uint64_t> CountTasksByStatus(Transaction&) = 0;

  virtual uint64_t SumBytesTransferred(Transaction&) = 0;

  // Deletes completed/failed/cancelled tasks with completed_at_ms <= cutoff_ms.
  virtual Result DeleteTerminalTasks(Transaction&, uint64_t cutoff_ms, uint64_t& removed) = 0;
};

} // namespace datarouter::db
