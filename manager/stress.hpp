#ifndef MANAGER_STRESS_HPP
#define MANAGER_STRESS_HPP

#include <set>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/verdict.hpp"
#include "manager/context.hpp"

namespace manager {

struct StressResult {
  std::string solution;
  // Every verdict the solution got, including after it was dropped from
  // the run.
  std::set<core::Verdict> verdicts;
  // First generator command on which the solution broke its tag.
  absl::optional<std::string> counterexample;
};

// Builds the problem first, so a problem that cannot be judged throws
// core::ConfigurationError before any test is generated. Then generates a
// test for every command the template expands to and judges the
// candidates on it against the main solution, without using or filling the
// verdict cache. A candidate that breaks its tag is not judged again. Stops
// early when every candidate has been dropped. An empty candidate list means
// every solution except the main one. Results follow the order of the
// candidates.
std::vector<StressResult> Stress(const JudgeContext& context,
                                 const std::string& command_template,
                                 const std::vector<std::string>& candidates =
                                     {});

}  // namespace manager

#endif
