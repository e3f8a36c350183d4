#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace datarouter::db::memory {

namespace {

bool IsActive(const model::MigrationTaskRecord& r) {
  return r.status == kTaskQueued || r.status == kTaskInProgress;
}

bool SameTuple(const model::MigrationTaskRecord& r, const std::string& source, const std::string& destination, const std::string& content_id) {
  return r.source_backend == source && r.destination_backend == destination && r.content_id == content_id;
}

bool Matches(const model::MigrationTaskRecord& r, const TaskFilter& f) {
  if (f.status && r.status != *f.status) return false;
  if (f.source_backend && r.source_backend != *f.source_backend) return false;
  if (f.destination_backend && r.destination_backend != *f.destination_backend) return false;
  if (f.batch_id && r.batch_id != *f.batch_id) return false;
  if (f.policy_name && r.policy_name != *f.policy_name) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Routing rules
// ------------------------------------------------------------------

Result MemoryRepository::InsertRule(Transaction& t, const model::RoutingRuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.rules.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "rule id exists: " + r.id);
  s.rules[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRule(Transaction& t, const model::RoutingRuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.rules.contains(r.id)) return Result::Err(ErrorCode::NotFound, "rule not found: " + r.id);
  s.rules[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRule(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().rules.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "rule not found: " + id);
  return Result::Ok();
}

std::optional<model::RoutingRuleRecord> MemoryRepository::GetRule(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.rules.find(id);
  if (it == s.rules.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RoutingRuleRecord> MemoryRepository::ListRules(Transaction& t) {
  std::vector<model::RoutingRuleRecord> out;
  for (const auto& [_, record] : TX(t).View().rules)
    out.push_back(record);
  return out;
}

// ------------------------------------------------------------------
// Migration policies
// ------------------------------------------------------------------

Result MemoryRepository::InsertPolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.policies.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "policy exists: " + r.name);
  s.policies[r.name] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdatePolicy(Transaction& t, const model::MigrationPolicyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.policies.contains(r.name)) return Result::Err(ErrorCode::NotFound, "policy not found: " + r.name);
  s.policies[r.name] = r;
  return Result::Ok();
}

Result MemoryRepository::DeletePolicy(Transaction& t, const std::string& name) {
  if (TX(t).Mutable().policies.erase(name) == 0) return Result::Err(ErrorCode::NotFound, "policy not found: " + name);
  return Result::Ok();
}

std::optional<model::MigrationPolicyRecord> MemoryRepository::GetPolicy(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.policies.find(name);
  if (it == s.policies.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MigrationPolicyRecord> MemoryRepository::ListPolicies(Transaction& t) {
  std::vector<model::MigrationPolicyRecord> out;
  for (const auto& [_, record] : TX(t).View().policies)
    out.push_back(record);
  return out;
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::MigrationBatchRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.batches.contains(r.batch_id)) return Result::Err(ErrorCode::AlreadyExists, "batch exists: " + r.batch_id);
  s.batches[r.batch_id] = r;
  return Result::Ok();
}

std::optional<model::MigrationBatchRecord> MemoryRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.batches.find(batch_id);
  if (it == s.batches.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, model::MigrationTaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.id);

  if (IsActive(r)) {
    for (const auto& [_, existing] : s.tasks) {
      if (IsActive(existing) && SameTuple(existing, r.source_backend, r.destination_backend, r.content_id)) {
        return Result::Err(ErrorCode::ConstraintViolation, "active task exists: " + existing.id);
      }
    }
  }

  r.seq         = s.next_task_seq++;
  s.tasks[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::MigrationTaskRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(r.id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + r.id);

  if (IsActive(r) && !IsActive(it->second)) {
    for (const auto& [id, existing] : s.tasks) {
      if (id != r.id && IsActive(existing) && SameTuple(existing, r.source_backend, r.destination_backend, r.content_id)) {
        return Result::Err(ErrorCode::ConstraintViolation, "active task exists: " + existing.id);
      }
    }
  }

  const auto seq = it->second.seq;
  it->second     = r;
  it->second.seq = seq;
  return Result::Ok();
}

std::optional<model::MigrationTaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MigrationTaskRecord> MemoryRepository::ListTasks(Transaction& t, const TaskFilter& filter) {
  std::vector<model::MigrationTaskRecord> matched;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (Matches(record, filter)) matched.push_back(record);
  }

  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.seq > b.seq;
  });

  if (filter.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(filter.offset);
  auto last  = matched.end();
  if (filter.limit > 0 && filter.limit < static_cast<uint64_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(filter.limit);
  }
  return {first, last};
}

std::optional<model::MigrationTaskRecord> MemoryRepository::FindActiveTask(Transaction& t, const std::string& source_backend,
                                                                           const std::string& destination_backend, const std::string& content_id) {
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (IsActive(record) && SameTuple(record, source_backend, destination_backend, content_id)) return record;
  }
  return std::nullopt;
}

std::optional<model::MigrationTaskRecord> MemoryRepository::NextQueuedTask(Transaction& t, uint64_t now_ms) {
  const model::MigrationTaskRecord* best = nullptr;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (record.status != kTaskQueued || record.eligible_at_ms > now_ms) continue;
    if (!best || record.priority > best->priority || (record.priority == best->priority && record.seq < best->seq)) {
      best = &record;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

std::map<int32_t, uint64_t> MemoryRepository::CountTasksByStatus(Transaction& t) {
  std::map<int32_t, uint64_t> counts;
  for (const auto& [_, record] : TX(t).View().tasks)
    ++counts[record.status];
  return counts;
}

uint64_t MemoryRepository::SumBytesTransferred(Transaction& t) {
  uint64_t total = 0;
  for (const auto& [_, record] : TX(t).View().tasks)
    total += record.bytes_transferred;
  return total;
}

Result MemoryRepository::DeleteTerminalTasks(Transaction& t, uint64_t cutoff_ms, uint64_t& removed) {
  auto& tasks = TX(t).Mutable().tasks;
  removed     = 0;
  for (auto it = tasks.begin(); it != tasks.end();) {
    const auto& r = it->second;
    if (!IsActive(r) && r.completed_at_ms.has_value() && *r.completed_at_ms <= cutoff_ms) {
      it = tasks.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace datarouter::db::memory
