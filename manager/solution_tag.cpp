#include "manager/solution_tag.hpp"

#include <algorithm>
#include <stdexcept>

namespace manager {

SolutionTag SolutionTag::FromName(
    const std::string& name,
    const absl::optional<std::set<core::Verdict>>& verdicts) {
  if (name == "main") return Main();
  if (name == "correct") return Correct();
  if (name == "incorrect") {
    if (!verdicts) {
      throw std::invalid_argument("Tag incorrect requires a list of verdicts");
    }
    return Incorrect(*verdicts);
  }
  throw std::invalid_argument("Invalid solution tag " + name);
}

const char* SolutionTag::Name() const {
  switch (kind_) {
    case MAIN:
      return "main";
    case CORRECT:
      return "correct";
    case INCORRECT:
      return "incorrect";
  }
  return "";
}

bool SolutionTag::CheckOne(core::Verdict verdict) const {
  if (verdict == core::Verdict::OK) return true;
  if (kind_ != INCORRECT) return false;
  return allowed_.count(verdict) != 0;
}

bool SolutionTag::CheckAll(const std::vector<core::Verdict>& verdicts) const {
  for (core::Verdict verdict : verdicts) {
    if (!CheckOne(verdict)) return false;
  }
  if (kind_ != INCORRECT || allowed_.count(core::Verdict::OK)) return true;
  return std::any_of(
      verdicts.begin(), verdicts.end(),
      [](core::Verdict verdict) { return verdict != core::Verdict::OK; });
}

}  // namespace manager
