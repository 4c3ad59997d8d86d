#ifndef JUDGE_VALIDATOR_HPP
#define JUDGE_VALIDATOR_HPP

#include <string>
#include <vector>

#include "core/program.hpp"
#include "judge/judgment.hpp"

namespace judge {

// Runs validator on input, passed both as the only argument and as standard
// input. Exit code 0 is OK, anything else is VALIDATION_FAILED.
Judgment Validate(const core::Program& validator, const std::string& input);

// Runs every validator in order and stops at the first rejection. The
// comment of a rejection names the validator.
Judgment ValidateAll(const std::vector<core::Program>& validators,
                     const std::string& input);

}  // namespace judge

#endif
