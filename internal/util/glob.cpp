#include "glob.hpp"

namespace datarouter::util {

bool HasWildcard(std::string_view pattern) {
  return pattern.find_first_of("*?") != std::string_view::npos;
}

bool GlobMatch(std::string_view pattern, std::string_view subject) {
  size_t p = 0;
  size_t s = 0;

  // backtrack point for the most recent '*'
  size_t star       = std::string_view::npos;
  size_t star_match = 0;

  while (s < subject.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == subject[s])) {
      ++p;
      ++s;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star       = p++;
      star_match = s;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      s = ++star_match;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*')
    ++p;

  return p == pattern.size();
}

} // namespace datarouter::util
