#include "manager/evaluation.hpp"

#include "core/errors.hpp"
#include "core/execution.hpp"
#include "glog/logging.h"
#include "judge/checker.hpp"
#include "judge/interactor.hpp"
#include "util/file.hpp"

namespace manager {

const core::Program& Evaluation::Checker() const {
  const Problem& problem = context_->GetProblem();
  if (!problem.checker) {
    throw core::ConfigurationError("Active checker is not set");
  }
  return *problem.checker;
}

const core::Program& Evaluation::Interactor() const {
  const Problem& problem = context_->GetProblem();
  if (!problem.interactor) {
    throw core::ConfigurationError("Active interactor is not set");
  }
  return *problem.interactor;
}

std::vector<judge::Dependency> Evaluation::Dependencies(
    const Solution& solution, const TestCase& test) const {
  const Problem& problem = context_->GetProblem();
  const Layout& layout = context_->GetLayout();
  std::vector<judge::Dependency> dependencies =
      generation_.InputDependencies(test);
  dependencies.push_back(judge::Dependency::File(layout.Output(
      context_->MainSolution().Identifier(), test.Index())));
  dependencies.push_back(judge::Dependency::File(solution.program.Source()));
  if (!solution.program.Descriptor().empty()) {
    dependencies.push_back(
        judge::Dependency::File(solution.program.Descriptor()));
  }
  if (problem.checker) {
    dependencies.push_back(judge::Dependency{problem.checker->Identifier(),
                                             problem.checker->ArtifactTime()});
  } else {
    dependencies.push_back(judge::Dependency{"checker", absl::nullopt});
  }
  if (problem.interactive) {
    if (problem.interactor) {
      dependencies.push_back(
          judge::Dependency{problem.interactor->Identifier(),
                            problem.interactor->ArtifactTime()});
    } else {
      dependencies.push_back(judge::Dependency{"interactor", absl::nullopt});
    }
  }
  return dependencies;
}

bool Evaluation::NeedsJudge(const Solution& solution,
                            const TestCase& test) const {
  std::string record = context_->GetLayout().VerdictRecord(
      solution.Identifier(), test.Index());
  return judge::NeedsRejudge(judge::VerdictRecordStore::CachedAt(record),
                             Dependencies(solution, test));
}

core::ExecutionOutcome Evaluation::Invoke(const Solution& solution,
                                          const TestCase& test) const {
  const Problem& problem = context_->GetProblem();
  solution.program.EnsureCompiled();
  std::string input = generation_.InputPath(test);
  std::string output =
      context_->GetLayout().Output(solution.Identifier(), test.Index());
  util::File::MakeDirs(util::File::BaseDir(output));

  core::Execution execution(
      "Solution " + solution.Identifier() + " on test " +
          std::to_string(test.Index()),
      solution.program.ExecuteCommand());
  execution.SetLimits(problem.limits);
  execution.UseTempDirectory();
  if (problem.interactive) {
    const core::Program& interactor = Interactor();
    interactor.EnsureCompiled();
    return judge::Interact(&execution, interactor, input, output);
  }
  execution.Input(problem.input_file, input);
  execution.Output(problem.output_file, output);
  return execution.Run();
}

core::ExecutionOutcome Evaluation::Judge(const Solution& solution,
                                         const TestCase& test,
                                         bool use_cache) const {
  const Problem& problem = context_->GetProblem();
  const Layout& layout = context_->GetLayout();
  const Solution& main = context_->MainSolution();
  std::string record =
      layout.VerdictRecord(solution.Identifier(), test.Index());

  if (use_cache && !NeedsJudge(solution, test)) {
    absl::optional<core::ExecutionOutcome> cached =
        judge::VerdictRecordStore::Load(record);
    if (cached) {
      VLOG(1) << "Cached verdict of " << solution.Identifier() << " on test "
              << test.Index() << ": " << cached->verdict;
      return *cached;
    }
  }

  generation_.EnsureInput(test);
  std::string answer = layout.Output(main.Identifier(), test.Index());
  if (&solution != &main) {
    if (use_cache) {
      Judge(main, test, true);
    } else {
      absl::optional<double> answer_time =
          util::File::ModificationTime(answer);
      absl::optional<double> input_time =
          util::File::ModificationTime(generation_.InputPath(test));
      if (!answer_time || (input_time && *answer_time < *input_time)) {
        Judge(main, test, false);
      }
    }
  }

  LOG(INFO) << "Judging " << solution.Identifier() << " on test "
            << test.Index();
  core::ExecutionOutcome outcome = Invoke(solution, test);
  if (outcome.verdict == core::Verdict::OK && !problem.interactive) {
    const core::Program& checker = Checker();
    checker.EnsureCompiled();
    judge::Judgment judgment = judge::Check(
        checker, generation_.InputPath(test),
        layout.Output(solution.Identifier(), test.Index()), answer);
    outcome.verdict = judgment.verdict;
    outcome.comment = judgment.comment;
  }
  LOG(INFO) << solution.Identifier() << " on test " << test.Index() << ": "
            << outcome.verdict
            << (outcome.comment.empty() ? "" : " (" + outcome.comment + ")");

  if (use_cache) judge::VerdictRecordStore::Save(record, outcome);
  return outcome;
}

}  // namespace manager
