#pragma once

#include <string>

namespace datarouter::util {

// Random RFC 4122 version 4 id in canonical 8-4-4-4-12 lowercase form.
// Used for rule, task and batch ids and for content stored without an id.
std::string GenerateId();

} // namespace datarouter::util
