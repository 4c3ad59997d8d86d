#ifndef MANAGER_BUILD_HPP
#define MANAGER_BUILD_HPP

#include <string>
#include <vector>

#include "core/verdict.hpp"
#include "manager/context.hpp"

namespace manager {

// How a solution did on every test of the problem, in test order.
struct SolutionReport {
  std::string solution;
  std::vector<core::ExecutionOutcome> outcomes;
  bool tag_ok = false;

  std::vector<core::Verdict> Verdicts() const;
};

// Checks that the problem can be judged: the active checker (and interactor)
// and every validator compile, every test exists and is valid, and the main
// solution gets OK everywhere. Throws core::ConfigurationError describing the
// first problem found.
void BuildProblem(const JudgeContext& context);
void BuildProblem(const Problem& problem);

// Builds the problem, then judges every solution on every test and checks
// the verdicts against its tag. Logs a warning for suspicious but legal
// setups. Once every solution is judged, throws core::ConfigurationError
// naming all the solutions whose tag does not match.
std::vector<SolutionReport> VerifyProblem(const JudgeContext& context);
std::vector<SolutionReport> VerifyProblem(const Problem& problem);

}  // namespace manager

#endif
