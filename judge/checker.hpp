#ifndef JUDGE_CHECKER_HPP
#define JUDGE_CHECKER_HPP

#include <string>

#include "core/execution.hpp"
#include "core/program.hpp"
#include "judge/judgment.hpp"

namespace judge {

// Maps the result of a checker or interactor run: exit codes 0, 1 and 2 are
// OK, WRONG_ANSWER and PRESENTATION_ERROR, everything else (including death
// by signal and wall limit kills) is CHECK_FAILED. The comment is the
// trimmed standard error.
Judgment CheckerJudgment(const core::Execution& execution);

// Runs checker with arguments (input, output, answer).
Judgment Check(const core::Program& checker, const std::string& input,
               const std::string& output, const std::string& answer);

}  // namespace judge

#endif
