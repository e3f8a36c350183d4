#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace datarouter::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both bind in order, so one Params list serves either backend.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, std::string>;

using Params = std::vector<Param>;

enum class Placeholder { kQuestion, kDollar };

} // namespace datarouter::db::sql
