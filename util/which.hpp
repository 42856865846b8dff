#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Returns the full path of the executable cmd found in $PATH, or an empty
// string. Absolute and relative paths are returned unchanged if they exist.
// Throws if $PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
