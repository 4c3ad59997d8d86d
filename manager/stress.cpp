#include "manager/stress.hpp"

#include "core/errors.hpp"
#include "glog/logging.h"
#include "manager/build.hpp"
#include "manager/evaluation.hpp"
#include "manager/generation.hpp"
#include "manager/test_command.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

std::vector<StressResult> Stress(const JudgeContext& context,
                                 const std::string& command_template,
                                 const std::vector<std::string>& candidates) {
  BuildProblem(context);
  const Problem& problem = context.GetProblem();
  const Solution& main = context.MainSolution();

  std::vector<const Solution*> solutions;
  if (candidates.empty()) {
    for (const Solution& solution : problem.solutions) {
      if (&solution != &main) solutions.push_back(&solution);
    }
  } else {
    for (const std::string& identifier : candidates) {
      const Solution* solution = problem.FindSolution(identifier);
      if (solution == nullptr) {
        throw core::ConfigurationError("Unknown solution " + identifier);
      }
      solutions.push_back(solution);
    }
  }

  std::vector<StressResult> results(solutions.size());
  for (size_t i = 0; i < solutions.size(); i++) {
    results[i].solution = solutions[i]->Identifier();
  }
  if (solutions.empty()) {
    LOG(WARNING) << "No solutions to stress";
    return results;
  }

  std::vector<std::string> commands = ExpandGeneratorCommand(command_template);
  util::TempDir scratch(FLAGS_temp_directory);
  JudgeContext scratch_context = context.WithLayout(Layout(scratch.Path()));
  Generation generation(&scratch_context);
  Evaluation evaluation(&scratch_context);

  std::vector<size_t> alive;
  for (size_t i = 0; i < solutions.size(); i++) alive.push_back(i);

  for (const std::string& command : commands) {
    if (alive.empty()) break;
    TestCase test = TestCase::Generated(1, command);
    generation.Generate(test);
    core::ExecutionOutcome reference = evaluation.Judge(main, test, false);
    if (reference.verdict != core::Verdict::OK) {
      LOG(WARNING) << "Main solution " << main.Identifier() << " gets "
                   << reference.verdict << " on " << command;
    }
    std::vector<size_t> still_alive;
    for (size_t i : alive) {
      core::ExecutionOutcome outcome =
          evaluation.Judge(*solutions[i], test, false);
      results[i].verdicts.insert(outcome.verdict);
      if (solutions[i]->tag.CheckOne(outcome.verdict)) {
        still_alive.push_back(i);
      } else {
        LOG(INFO) << "Solution " << solutions[i]->Identifier() << " gets "
                  << outcome.verdict << " on " << command;
        results[i].counterexample = command;
      }
    }
    alive.swap(still_alive);
  }
  return results;
}

}  // namespace manager
