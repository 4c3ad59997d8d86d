#include "manager/generation.hpp"

#include <stdexcept>

#include "core/errors.hpp"
#include "glog/logging.h"
#include "judge/generator.hpp"
#include "judge/validator.hpp"
#include "util/file.hpp"
#include "util/shell.hpp"

namespace manager {

std::string Generation::InputPath(const TestCase& test) const {
  if (!test.IsGenerated()) return test.StoredPath();
  return context_->GetLayout().GeneratedInput(test.Index());
}

const core::Program& Generation::GeneratorOf(
    const TestCase& test, std::vector<std::string>* args) const {
  std::vector<std::string> words = util::ShellSplit(test.Command());
  if (words.empty()) {
    throw core::ConfigurationError("Test " + std::to_string(test.Index()) +
                                   " has an empty generator command");
  }
  const core::Program* generator =
      context_->GetProblem().FindGenerator(words[0]);
  if (generator == nullptr) {
    throw core::ConfigurationError("Unknown generator " + words[0] +
                                   " in test " +
                                   std::to_string(test.Index()));
  }
  if (args != nullptr) args->assign(words.begin() + 1, words.end());
  return *generator;
}

std::vector<judge::Dependency> Generation::InputDependencies(
    const TestCase& test) const {
  std::vector<judge::Dependency> dependencies;
  dependencies.push_back(judge::Dependency::File(InputPath(test)));
  if (!test.IsGenerated()) return dependencies;
  std::vector<std::string> words = util::ShellSplit(test.Command());
  const core::Program* generator =
      words.empty() ? nullptr : context_->GetProblem().FindGenerator(words[0]);
  if (generator == nullptr) {
    dependencies.push_back(judge::Dependency{test.Command(), absl::nullopt});
  } else {
    dependencies.push_back(
        judge::Dependency{generator->Source(), generator->SourceTime()});
  }
  return dependencies;
}

void Generation::EnsureInput(const TestCase& test) const {
  std::string input = InputPath(test);
  if (!test.IsGenerated()) {
    if (!util::File::Exists(input)) {
      throw core::ConfigurationError("Input " + input + " of test " +
                                     std::to_string(test.Index()) +
                                     " does not exist");
    }
    return;
  }
  const core::Program& generator = GeneratorOf(test, nullptr);
  generator.EnsureCompiled();
  absl::optional<double> input_time = util::File::ModificationTime(input);
  absl::optional<double> generator_time = generator.ArtifactTime();
  if (input_time && (!generator_time || *input_time >= *generator_time)) {
    VLOG(1) << "Input " << input << " is up to date";
    return;
  }
  Generate(test);
}

void Generation::Generate(const TestCase& test) const {
  if (!test.IsGenerated()) {
    throw std::invalid_argument("Test " + std::to_string(test.Index()) +
                                " is not generated");
  }
  std::vector<std::string> args;
  const core::Program& generator = GeneratorOf(test, &args);
  generator.EnsureCompiled();
  std::string input = InputPath(test);
  util::File::MakeDirs(util::File::BaseDir(input));
  judge::Generate(generator, args, input);
}

judge::Judgment Generation::Validate(const TestCase& test) const {
  const std::vector<core::Program>& validators =
      context_->GetProblem().validators;
  for (const core::Program& validator : validators) {
    validator.EnsureCompiled();
  }
  return judge::ValidateAll(validators, InputPath(test));
}

}  // namespace manager
