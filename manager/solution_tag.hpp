#ifndef MANAGER_SOLUTION_TAG_HPP
#define MANAGER_SOLUTION_TAG_HPP

#include <set>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/verdict.hpp"

namespace manager {

// What a solution is expected to get. The main solution and correct
// solutions must get OK everywhere. Incorrect solutions may get OK or one of
// the allowed verdicts on each test, and must fail at least one test unless
// OK is itself allowed.
class SolutionTag {
 public:
  enum Kind { MAIN, CORRECT, INCORRECT };

  static SolutionTag Main() { return SolutionTag(MAIN, {}); }
  static SolutionTag Correct() { return SolutionTag(CORRECT, {}); }
  static SolutionTag Incorrect(std::set<core::Verdict> allowed) {
    return SolutionTag(INCORRECT, std::move(allowed));
  }

  // Builds a tag from "main", "correct" or "incorrect". Throws
  // std::invalid_argument for other names, and for "incorrect" without a
  // list of verdicts.
  static SolutionTag FromName(
      const std::string& name,
      const absl::optional<std::set<core::Verdict>>& verdicts = absl::nullopt);

  Kind GetKind() const { return kind_; }
  const char* Name() const;
  const std::set<core::Verdict>& Allowed() const { return allowed_; }

  // Whether verdict is acceptable on a single test.
  bool CheckOne(core::Verdict verdict) const;

  // Whether the verdicts on the whole test set are acceptable.
  bool CheckAll(const std::vector<core::Verdict>& verdicts) const;

 private:
  SolutionTag(Kind kind, std::set<core::Verdict> allowed)
      : kind_(kind), allowed_(std::move(allowed)) {}

  Kind kind_;
  std::set<core::Verdict> allowed_;
};

}  // namespace manager

#endif
