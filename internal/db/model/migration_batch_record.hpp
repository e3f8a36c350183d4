#pragma once

#include <cstdint>
#include <string>

namespace datarouter::db::model {

struct MigrationBatchRecord {
  std::string batch_id;
  std::string policy_name;
  uint64_t    created_at_ms = 0;
  std::string task_ids_json = "[]";
};

} // namespace datarouter::db::model
