#include "judge/validator.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "core/execution.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace judge {

Judgment Validate(const core::Program& validator, const std::string& input) {
  std::vector<std::string> command = validator.ExecuteCommand();
  command.push_back(input);
  core::Execution execution("Validator " + validator.Identifier(), command);
  execution.Stdin(input);
  execution.WallLimit(FLAGS_tool_time_limit);
  execution.Run();
  Judgment judgment;
  if (execution.Killed() || execution.Signal() != 0) {
    judgment.verdict = core::Verdict::VALIDATION_FAILED;
  } else {
    judgment.verdict =
        core::VerdictFromValidatorExitCode(execution.StatusCode());
  }
  judgment.comment =
      std::string(absl::StripAsciiWhitespace(execution.Stderr()));
  return judgment;
}

Judgment ValidateAll(const std::vector<core::Program>& validators,
                     const std::string& input) {
  for (const core::Program& validator : validators) {
    Judgment judgment = Validate(validator, input);
    if (judgment.verdict != core::Verdict::OK) {
      LOG(WARNING) << "Validator " << validator.Identifier() << " rejected "
                   << input << ": " << judgment.comment;
      judgment.comment =
          absl::StrCat(validator.Identifier(), ": ", judgment.comment);
      return judgment;
    }
  }
  return Judgment();
}

}  // namespace judge
