#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace datarouter::db::model {

/*
  Persisted routing rule. List and map columns hold JSON text.
*/
struct RoutingRuleRecord {
  std::string id;
  std::string name;

  std::string categories_json = "[]";
  std::string patterns_json   = "[]";

  std::optional<uint64_t> min_size_bytes;
  std::optional<uint64_t> max_size_bytes;

  std::string preferred_json = "[]";
  std::string excluded_json  = "[]";

  int32_t     priority = 1;
  int32_t     strategy = 0;
  std::string custom_factors_json = "{}";

  bool wildcard = false;
  bool active   = true;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace datarouter::db::model
