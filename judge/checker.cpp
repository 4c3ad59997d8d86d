#include "judge/checker.hpp"

#include <vector>

#include "absl/strings/ascii.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace judge {

Judgment CheckerJudgment(const core::Execution& execution) {
  Judgment judgment;
  if (execution.Killed() || execution.Signal() != 0) {
    judgment.verdict = core::Verdict::CHECK_FAILED;
  } else {
    judgment.verdict = core::VerdictFromCheckerExitCode(execution.StatusCode());
  }
  judgment.comment =
      std::string(absl::StripAsciiWhitespace(execution.Stderr()));
  return judgment;
}

Judgment Check(const core::Program& checker, const std::string& input,
               const std::string& output, const std::string& answer) {
  std::vector<std::string> command = checker.ExecuteCommand();
  command.push_back(input);
  command.push_back(output);
  command.push_back(answer);
  core::Execution execution("Checker " + checker.Identifier(), command);
  execution.WallLimit(FLAGS_tool_time_limit);
  execution.Run();
  Judgment judgment = CheckerJudgment(execution);
  VLOG(1) << "Checker " << checker.Identifier() << " on " << output << ": "
          << judgment.verdict;
  return judgment;
}

}  // namespace judge
