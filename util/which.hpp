#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable called cmd in $PATH, or an empty string. Commands that
// already contain a slash are returned unchanged. Results are cached unless
// explicitly disabled; a cached entry is kept even if the file disappears.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
