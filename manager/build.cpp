#include "manager/build.hpp"

#include "absl/strings/str_join.h"
#include "core/errors.hpp"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "manager/generation.hpp"

namespace manager {

std::vector<core::Verdict> SolutionReport::Verdicts() const {
  std::vector<core::Verdict> verdicts;
  for (const core::ExecutionOutcome& outcome : outcomes) {
    verdicts.push_back(outcome.verdict);
  }
  return verdicts;
}

void BuildProblem(const JudgeContext& context) {
  const Problem& problem = context.GetProblem();
  if (!problem.checker) {
    throw core::ConfigurationError("Active checker is not set");
  }
  problem.checker->EnsureCompiled();

  if (problem.interactive) {
    if (!problem.input_file.IsStandard() ||
        !problem.output_file.IsStandard()) {
      throw core::ConfigurationError("Interactive problems must use stdio");
    }
    if (!problem.interactor) {
      throw core::ConfigurationError("Active interactor is not set");
    }
    problem.interactor->EnsureCompiled();
  }

  const Solution& main = context.MainSolution();
  main.program.EnsureCompiled();
  for (const core::Program& validator : problem.validators) {
    validator.EnsureCompiled();
  }

  Generation generation(&context);
  for (const TestCase& test : problem.tests) {
    generation.EnsureInput(test);
    judge::Judgment judgment = generation.Validate(test);
    if (judgment.verdict != core::Verdict::OK) {
      throw core::ConfigurationError("Test " + std::to_string(test.Index()) +
                                     " rejected by validator " +
                                     judgment.comment);
    }
  }

  Evaluation evaluation(&context);
  for (const TestCase& test : problem.tests) {
    core::ExecutionOutcome outcome = evaluation.Judge(main, test);
    if (!main.tag.CheckOne(outcome.verdict)) {
      throw core::ConfigurationError(
          "Main solution " + main.Identifier() + " gets " +
          core::VerdictName(outcome.verdict) + " on test " +
          std::to_string(test.Index()) + ": " + outcome.comment);
    }
  }
  LOG(INFO) << "Problem " << problem.name << " built successfully";
}

void BuildProblem(const Problem& problem) {
  BuildProblem(JudgeContext::Create(problem));
}

namespace {

void Lint(const Problem& problem) {
  if (problem.tests.empty()) {
    LOG(WARNING) << "No test cases found";
  }
  bool prefix = true;
  for (const TestCase& test : problem.tests) {
    if (!test.Sample()) {
      prefix = false;
    } else if (!prefix) {
      LOG(WARNING) << "Test case " << test.Index()
                   << " is a sample, but is not among the first tests";
    }
  }
  if (problem.validators.empty()) {
    LOG(WARNING) << "No validators found, please consider adding them";
  }
}

}  // namespace

std::vector<SolutionReport> VerifyProblem(const JudgeContext& context) {
  BuildProblem(context);
  const Problem& problem = context.GetProblem();
  Evaluation evaluation(&context);
  std::vector<SolutionReport> reports;
  std::vector<std::string> wrong_tags;
  for (const Solution& solution : problem.solutions) {
    SolutionReport report;
    report.solution = solution.Identifier();
    for (const TestCase& test : problem.tests) {
      report.outcomes.push_back(evaluation.Judge(solution, test));
    }
    report.tag_ok = solution.tag.CheckAll(report.Verdicts());
    if (report.tag_ok) {
      LOG(INFO) << "Solution " << solution.Identifier() << " has correct tag";
    } else {
      LOG(ERROR) << "Solution " << solution.Identifier()
                 << " has incorrect tag " << solution.tag.Name();
      wrong_tags.push_back(solution.Identifier());
    }
    reports.push_back(std::move(report));
  }
  Lint(problem);
  if (!wrong_tags.empty()) {
    throw core::ConfigurationError("Solutions with incorrect tag: " +
                                   absl::StrJoin(wrong_tags, ", "));
  }
  return reports;
}

std::vector<SolutionReport> VerifyProblem(const Problem& problem) {
  return VerifyProblem(JudgeContext::Create(problem));
}

}  // namespace manager
