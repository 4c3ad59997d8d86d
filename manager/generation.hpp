#ifndef MANAGER_GENERATION_HPP
#define MANAGER_GENERATION_HPP

#include <string>
#include <vector>

#include "judge/judgment.hpp"
#include "judge/judgment_cache.hpp"
#include "manager/context.hpp"

namespace manager {

// Produces and checks the inputs of the tests of a problem.
class Generation {
 public:
  explicit Generation(const JudgeContext* context) : context_(context) {}

  // Stored tests are read where they are stored, generated tests from the
  // layout.
  std::string InputPath(const TestCase& test) const;

  // What the input of test is made from, for the judgment cache.
  std::vector<judge::Dependency> InputDependencies(const TestCase& test) const;

  // Makes sure the input of test exists, generating it again if it is
  // missing or older than its generator. Throws core::ConfigurationError if
  // a stored input is missing.
  void EnsureInput(const TestCase& test) const;

  // Runs the generator command of test. The first word of the command is the
  // identifier of one of the generators of the problem, the others are its
  // arguments.
  void Generate(const TestCase& test) const;

  // Runs the active validators on the input of test.
  judge::Judgment Validate(const TestCase& test) const;

 private:
  const core::Program& GeneratorOf(const TestCase& test,
                                   std::vector<std::string>* args) const;

  const JudgeContext* context_;
};

}  // namespace manager

#endif
