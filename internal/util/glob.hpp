#pragma once

#include <string_view>

namespace datarouter::util {

/*
  Shell-style wildcard match over the whole subject.

    *  any run of characters (including empty)
    ?  exactly one character

  No character classes, no escaping.
*/
bool GlobMatch(std::string_view pattern, std::string_view subject);

bool HasWildcard(std::string_view pattern);

} // namespace datarouter::util
