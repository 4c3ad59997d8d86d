#include "judge/interactor.hpp"

#include <future>
#include <vector>

#include "glog/logging.h"
#include "judge/checker.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/pipe.hpp"

namespace judge {

core::ExecutionOutcome Interact(core::Execution* solution,
                                const core::Program& interactor,
                                const std::string& input,
                                const std::string& transcript) {
  util::Pipe to_interactor = util::Pipe::Create();
  util::Pipe to_solution = util::Pipe::Create();

  std::vector<std::string> command = interactor.ExecuteCommand();
  command.push_back(input);
  command.push_back(transcript);
  util::File::MakeDirs(util::File::BaseDir(transcript));
  core::Execution interaction("Interactor " + interactor.Identifier(),
                              command);
  interaction.Stdin(std::move(to_interactor.read));
  interaction.Stdout(std::move(to_solution.write));
  interaction.WallLimit(FLAGS_tool_time_limit);

  solution->Stdin(std::move(to_solution.read));
  solution->Stdout(std::move(to_interactor.write));

  // Each Execution owns its pipe ends and closes them when its process exits,
  // so the other side sees end of file instead of blocking.
  std::future<core::ExecutionOutcome> interactor_done = std::async(
      std::launch::async, [&interaction]() { return interaction.Run(); });
  core::ExecutionOutcome outcome = solution->Run();
  interactor_done.get();

  if (outcome.verdict != core::Verdict::OK) {
    VLOG(1) << solution->Description() << " ended with " << outcome.verdict
            << ", interactor not consulted";
    return outcome;
  }
  Judgment judgment = CheckerJudgment(interaction);
  outcome.verdict = judgment.verdict;
  outcome.comment = judgment.comment;
  return outcome;
}

}  // namespace judge
