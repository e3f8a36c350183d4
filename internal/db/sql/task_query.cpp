#include "task_query.hpp"

namespace datarouter::db::sql {

namespace {

std::string Next(Placeholder style, std::size_t index) {
  if (style == Placeholder::kQuestion) return "?";
  return "$" + std::to_string(index);
}

} // namespace

Fragment TaskWhere(const TaskFilter& filter, Placeholder style) {
  Fragment out;

  auto add = [&](const char* column, Param value) {
    out.text += out.params.empty() ? " WHERE " : " AND ";
    out.params.push_back(std::move(value));
    out.text += column;
    out.text += "=" + Next(style, out.params.size());
  };

  if (filter.status) add("status", *filter.status);
  if (filter.source_backend) add("source_backend", *filter.source_backend);
  if (filter.destination_backend) add("destination_backend", *filter.destination_backend);
  if (filter.batch_id) add("batch_id", *filter.batch_id);
  if (filter.policy_name) add("policy_name", *filter.policy_name);
  return out;
}

std::string TaskPage(const TaskFilter& filter, Placeholder style) {
  // SQLite only accepts OFFSET after a LIMIT
  std::string out;
  if (filter.limit > 0) {
    out += " LIMIT " + std::to_string(filter.limit);
  } else if (filter.offset > 0) {
    out += style == Placeholder::kQuestion ? " LIMIT -1" : " LIMIT ALL";
  }
  if (filter.offset > 0) out += " OFFSET " + std::to_string(filter.offset);
  return out;
}

} // namespace datarouter::db::sql
