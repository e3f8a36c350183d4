#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace datarouter::util {

/*
  Converts internal exceptions into their stable ErrorKind.
  Anything not derived from the types in errors.hpp is kInternal.
*/

ErrorKind KindOf(const std::exception& e);

} // namespace datarouter::util
