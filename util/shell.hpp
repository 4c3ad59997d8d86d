#ifndef UTIL_SHELL_HPP
#define UTIL_SHELL_HPP

#include <string>
#include <vector>

namespace util {

// Splits a command line the way a POSIX shell would, honoring single quotes,
// double quotes and backslash escapes. Throws std::invalid_argument on an
// unterminated quote or a trailing backslash.
std::vector<std::string> ShellSplit(const std::string& command);

// Quotes a single word so that ShellSplit (and a shell) gives it back
// unchanged. Words made only of safe characters are returned as they are.
std::string ShellQuote(const std::string& word);

// Quotes every word and joins them with single spaces.
std::string ShellJoin(const std::vector<std::string>& words);

}  // namespace util

#endif
