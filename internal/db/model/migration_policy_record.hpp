#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace datarouter::db::model {

struct MigrationPolicyRecord {
  std::string name;
  std::string description;
  std::string source_backend;
  std::string destination_backend;

  std::optional<std::string> filter_type;
  std::optional<std::string> filter_prefix;
  std::string                filter_custom_json = "{}";
  std::optional<uint64_t>    filter_min_size_bytes;
  std::optional<uint64_t>    filter_max_size_bytes;

  int32_t schedule         = 0;
  int32_t priority         = 1;
  bool    delete_source    = false;
  bool    verify_integrity = false;
  bool    enabled          = true;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> last_run_at_ms;
  uint64_t                run_count           = 0;
  uint64_t                total_tasks_created = 0;
};

} // namespace datarouter::db::model
