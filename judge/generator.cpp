#include "judge/generator.hpp"

#include "absl/strings/str_join.h"
#include "core/errors.hpp"
#include "core/execution.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace judge {

void Generate(const core::Program& generator,
              const std::vector<std::string>& args,
              const std::string& destination) {
  std::vector<std::string> command = generator.ExecuteCommand();
  command.insert(command.end(), args.begin(), args.end());
  LOG(INFO) << "Generating " << destination << " with "
            << generator.Identifier() << " " << absl::StrJoin(args, " ");
  core::Execution execution("Generator " + generator.Identifier(), command);
  execution.Stdout(destination);
  execution.WallLimit(FLAGS_tool_time_limit);
  execution.Run();
  bool failed = execution.Killed() || execution.StatusCode() != 0 ||
                execution.Signal() != 0;
  // A partial test must not look up to date.
  if (failed && util::File::Exists(destination)) {
    util::File::Remove(destination);
  }
  if (execution.Killed()) {
    throw core::ConfigurationError("Generator " + generator.Identifier() +
                                   " timed out");
  }
  if (execution.StatusCode() != 0 || execution.Signal() != 0) {
    throw core::ConfigurationError(
        "Generator " + generator.Identifier() + " failed with status " +
        std::to_string(execution.StatusCode()) + ", signal " +
        std::to_string(execution.Signal()) + ":\n" + execution.Stderr());
  }
}

}  // namespace judge
