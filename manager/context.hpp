#ifndef MANAGER_CONTEXT_HPP
#define MANAGER_CONTEXT_HPP

#include "manager/problem.hpp"

namespace manager {

// The problem being prepared, its main solution and the layout where files
// are produced. Built once per top-level operation and handed to everything
// that judges. The problem must outlive the context.
class JudgeContext {
 public:
  // Throws core::ConfigurationError if the problem does not have exactly one
  // main solution.
  static JudgeContext Create(const Problem& problem);
  static JudgeContext Create(const Problem& problem, Layout layout);

  const Problem& GetProblem() const { return *problem_; }
  const Solution& MainSolution() const { return *main_; }
  const Layout& GetLayout() const { return layout_; }

  // Same problem, files produced under layout.
  JudgeContext WithLayout(Layout layout) const;

 private:
  JudgeContext(const Problem* problem, const Solution* main, Layout layout)
      : problem_(problem), main_(main), layout_(std::move(layout)) {}

  const Problem* problem_;
  const Solution* main_;
  Layout layout_;
};

}  // namespace manager

#endif
