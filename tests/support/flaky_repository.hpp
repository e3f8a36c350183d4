#pragma once

#include <atomic>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace datarouter::testing {

/*
  MemoryRepository with injectable UpdateTask failures.
  Every other call is forwarded unchanged.
*/
class FlakyRepository final : public db::Repository {
 public:
  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertRule(db::Transaction& tx, const db::model::RoutingRuleRecord& r) override {
    return inner_.InsertRule(tx, r);
  }
  db::Result UpdateRule(db::Transaction& tx, const db::model::RoutingRuleRecord& r) override {
    return inner_.UpdateRule(tx, r);
  }
  db::Result DeleteRule(db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteRule(tx, id);
  }
  std::optional<db::model::RoutingRuleRecord> GetRule(db::Transaction& tx, const std::string& id) override {
    return inner_.GetRule(tx, id);
  }
  std::vector<db::model::RoutingRuleRecord> ListRules(db::Transaction& tx) override {
    return inner_.ListRules(tx);
  }

  db::Result InsertPolicy(db::Transaction& tx, const db::model::MigrationPolicyRecord& r) override {
    return inner_.InsertPolicy(tx, r);
  }
  db::Result UpdatePolicy(db::Transaction& tx, const db::model::MigrationPolicyRecord& r) override {
    return inner_.UpdatePolicy(tx, r);
  }
  db::Result DeletePolicy(db::Transaction& tx, const std::string& name) override {
    return inner_.DeletePolicy(tx, name);
  }
  std::optional<db::model::MigrationPolicyRecord> GetPolicy(db::Transaction& tx, const std::string& name) override {
    return inner_.GetPolicy(tx, name);
  }
  std::vector<db::model::MigrationPolicyRecord> ListPolicies(db::Transaction& tx) override {
    return inner_.ListPolicies(tx);
  }

  db::Result InsertBatch(db::Transaction& tx, const db::model::MigrationBatchRecord& r) override {
    return inner_.InsertBatch(tx, r);
  }
  std::optional<db::model::MigrationBatchRecord> GetBatch(db::Transaction& tx, const std::string& batch_id) override {
    return inner_.GetBatch(tx, batch_id);
  }

  db::Result InsertTask(db::Transaction& tx, db::model::MigrationTaskRecord& r) override {
    return inner_.InsertTask(tx, r);
  }
  db::Result UpdateTask(db::Transaction& tx, const db::model::MigrationTaskRecord& r) override {
    if (fail_task_updates > 0) {
      --fail_task_updates;
      ++failed_task_updates;
      return db::Result::Err(db::ErrorCode::Busy, "database is locked");
    }
    return inner_.UpdateTask(tx, r);
  }
  std::optional<db::model::MigrationTaskRecord> GetTask(db::Transaction& tx, const std::string& id) override {
    return inner_.GetTask(tx, id);
  }
  std::vector<db::model::MigrationTaskRecord> ListTasks(db::Transaction& tx, const db::TaskFilter& filter) override {
    return inner_.ListTasks(tx, filter);
  }
  std::optional<db::model::MigrationTaskRecord> FindActiveTask(db::Transaction& tx, const std::string& source_backend,
                                                               const std::string& destination_backend, const std::string& content_id) override {
    return inner_.FindActiveTask(tx, source_backend, destination_backend, content_id);
  }
  std::optional<db::model::MigrationTaskRecord> NextQueuedTask(db::Transaction& tx, uint64_t now_ms) override {
    return inner_.NextQueuedTask(tx, now_ms);
  }
  std::map<int32_t, uint64_t> CountTasksByStatus(db::Transaction& tx) override {
    return inner_.CountTasksByStatus(tx);
  }
  uint64_t SumBytesTransferred(db::Transaction& tx) override {
    return inner_.SumBytesTransferred(tx);
  }
  db::Result DeleteTerminalTasks(db::Transaction& tx, uint64_t cutoff_ms, uint64_t& removed) override {
    return inner_.DeleteTerminalTasks(tx, cutoff_ms, removed);
  }

  std::atomic<int> fail_task_updates{0};
  std::atomic<int> failed_task_updates{0};

 private:
  db::memory::MemoryRepository inner_;
};

} // namespace datarouter::testing
