#ifndef MANAGER_TEST_COMMAND_HPP
#define MANAGER_TEST_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace manager {

// Whether token looks like a range: "[a..c]" or "[a,b..c]".
bool IsRange(const std::string& token);

// Values of a range token. "[a..c]" counts from a to c with step 1,
// "[a,b..c]" uses step b - a; c is included when it is hit. Throws
// std::invalid_argument for malformed numbers, a zero step, "[a..c]" with
// a > c, and a step that moves away from c.
std::vector<int64_t> ExpandRange(const std::string& token);

// Expands every range in a generator command into the commands it stands
// for. Words are split like a shell would and every result is quoted back,
// one space between words. The leftmost range varies fastest:
// "gen [1..2] [1..2]" gives "gen 1 1", "gen 2 1", "gen 1 2", "gen 2 2".
std::vector<std::string> ExpandGeneratorCommand(const std::string& command);

// True if command expands to exactly itself, so it can be stored as is.
bool ExpandsTrivially(const std::string& command);

}  // namespace manager

#endif
