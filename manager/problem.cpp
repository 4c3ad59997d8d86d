#include "manager/problem.hpp"

#include "absl/strings/str_format.h"
#include "util/file.hpp"

namespace manager {

std::string Layout::TestName(int64_t index) {
  return absl::StrFormat("%02d", index);
}

std::string Layout::GeneratedInput(int64_t index) const {
  return util::File::JoinPath(util::File::JoinPath(root_, "tests"),
                              TestName(index));
}

std::string Layout::Output(const std::string& solution, int64_t index) const {
  return util::File::JoinPath(
      util::File::JoinPath(util::File::JoinPath(root_, "outputs"), solution),
      TestName(index));
}

std::string Layout::VerdictRecord(const std::string& solution,
                                  int64_t index) const {
  return util::File::JoinPath(
      util::File::JoinPath(util::File::JoinPath(root_, "verdicts"), solution),
      TestName(index));
}

std::string Layout::Executable(const std::string& identifier) const {
  return util::File::JoinPath(util::File::JoinPath(root_, "bin"), identifier);
}

const core::Program* Problem::FindGenerator(
    const std::string& identifier) const {
  for (const core::Program& generator : generators) {
    if (generator.Identifier() == identifier) return &generator;
  }
  return nullptr;
}

const Solution* Problem::FindSolution(const std::string& identifier) const {
  for (const Solution& solution : solutions) {
    if (solution.Identifier() == identifier) return &solution;
  }
  return nullptr;
}

}  // namespace manager
