#include "manager/context.hpp"

#include "core/errors.hpp"

namespace manager {

JudgeContext JudgeContext::Create(const Problem& problem) {
  return Create(problem, problem.layout);
}

JudgeContext JudgeContext::Create(const Problem& problem, Layout layout) {
  const Solution* main = nullptr;
  for (const Solution& solution : problem.solutions) {
    if (solution.tag.GetKind() != SolutionTag::MAIN) continue;
    if (main != nullptr) {
      throw core::ConfigurationError("Problem " + problem.name +
                                     " has two main solutions: " +
                                     main->Identifier() + " and " +
                                     solution.Identifier());
    }
    main = &solution;
  }
  if (main == nullptr) {
    throw core::ConfigurationError("Problem " + problem.name +
                                   " has no main solution");
  }
  return JudgeContext(&problem, main, std::move(layout));
}

JudgeContext JudgeContext::WithLayout(Layout layout) const {
  return JudgeContext(problem_, main_, std::move(layout));
}

}  // namespace manager
