#ifndef MANAGER_PROBLEM_HPP
#define MANAGER_PROBLEM_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/execution.hpp"
#include "core/program.hpp"
#include "core/verdict.hpp"
#include "manager/solution_tag.hpp"

namespace manager {

struct Solution {
  core::Program program;
  SolutionTag tag;

  const std::string& Identifier() const { return program.Identifier(); }
};

// A test case. Its input is either a file stored with the problem or the
// standard output of a generator command such as "gen 10 --max".
class TestCase {
 public:
  static TestCase Stored(int64_t index, std::string input_path,
                         bool sample = false) {
    return TestCase(index, sample, std::move(input_path), "");
  }
  static TestCase Generated(int64_t index, std::string command,
                            bool sample = false) {
    return TestCase(index, sample, "", std::move(command));
  }

  int64_t Index() const { return index_; }
  bool Sample() const { return sample_; }
  bool IsGenerated() const { return !command_.empty(); }
  const std::string& StoredPath() const { return stored_path_; }
  const std::string& Command() const { return command_; }

 private:
  TestCase(int64_t index, bool sample, std::string stored_path,
           std::string command)
      : index_(index),
        sample_(sample),
        stored_path_(std::move(stored_path)),
        command_(std::move(command)) {}

  int64_t index_;
  bool sample_;
  std::string stored_path_;
  std::string command_;
};

// Where the files produced while preparing a problem live, relative to a
// build root.
class Layout {
 public:
  Layout() = default;
  explicit Layout(std::string root) : root_(std::move(root)) {}

  const std::string& Root() const { return root_; }

  // Index of a test as used in file names: at least two digits.
  static std::string TestName(int64_t index);

  std::string GeneratedInput(int64_t index) const;
  std::string Output(const std::string& solution, int64_t index) const;
  std::string VerdictRecord(const std::string& solution, int64_t index) const;
  std::string Executable(const std::string& identifier) const;

 private:
  std::string root_;
};

// Everything the engine needs to know about a problem. Descriptors are
// parsed elsewhere; this is the result.
struct Problem {
  std::string name;
  std::string root;
  Layout layout;

  core::FileName input_file = core::FileName::Standard();
  core::FileName output_file = core::FileName::Standard();
  bool interactive = false;
  core::Limits limits;

  absl::optional<core::Program> checker;
  absl::optional<core::Program> interactor;
  std::vector<core::Program> validators;
  std::vector<core::Program> generators;
  std::vector<Solution> solutions;
  std::vector<TestCase> tests;

  // Returns the generator with the given identifier, or nullptr.
  const core::Program* FindGenerator(const std::string& identifier) const;
  const Solution* FindSolution(const std::string& identifier) const;
};

}  // namespace manager

#endif
