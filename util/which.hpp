#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. A command that contains a slash is
// returned as-is when it names an executable file. Returns an empty string if
// the command cannot be found.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
