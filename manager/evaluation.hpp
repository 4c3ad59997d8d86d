#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <vector>

#include "core/verdict.hpp"
#include "judge/judgment_cache.hpp"
#include "manager/context.hpp"
#include "manager/generation.hpp"

namespace manager {

// Runs solutions on tests and judges their output.
class Evaluation {
 public:
  explicit Evaluation(const JudgeContext* context)
      : context_(context), generation_(context) {}

  // Compiles solution if needed and runs it on test with the limits of the
  // problem. Its output is written to the layout. The input must exist.
  core::ExecutionOutcome Invoke(const Solution& solution,
                                const TestCase& test) const;

  // Judges solution on test. With use_cache, a fresh verdict record is
  // returned without running anything and new outcomes are recorded.
  core::ExecutionOutcome Judge(const Solution& solution, const TestCase& test,
                               bool use_cache = true) const;

  // Whether the verdict record of solution on test is missing or stale.
  bool NeedsJudge(const Solution& solution, const TestCase& test) const;

  // Files and programs the judgment of solution on test depends on.
  std::vector<judge::Dependency> Dependencies(const Solution& solution,
                                              const TestCase& test) const;

 private:
  const core::Program& Interactor() const;
  const core::Program& Checker() const;

  const JudgeContext* context_;
  Generation generation_;
};

}  // namespace manager

#endif
