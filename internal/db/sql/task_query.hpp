#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "sql_params.hpp"

namespace datarouter::db::sql {

struct Fragment {
  std::string text;
  Params      params;
};

// " WHERE ..." (or empty) for a task filter; params in placeholder order.
Fragment TaskWhere(const TaskFilter& filter, Placeholder style);

// " LIMIT .. OFFSET .." for a task filter, literal values.
std::string TaskPage(const TaskFilter& filter, Placeholder style);

} // namespace datarouter::db::sql
