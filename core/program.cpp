#include "core/program.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "core/execution.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace core {

Program::Program(std::string identifier, std::string source,
                 std::string descriptor, std::string executable,
                 Language language, std::vector<std::string> resource_dirs)
    : identifier_(std::move(identifier)),
      source_(std::move(source)),
      descriptor_(std::move(descriptor)),
      executable_(std::move(executable)),
      language_(std::move(language)),
      resource_dirs_(std::move(resource_dirs)) {}

absl::optional<double> Program::SourceTime() const {
  absl::optional<double> time = util::File::ModificationTime(source_);
  if (!time || descriptor_.empty()) return time;
  absl::optional<double> descriptor_time =
      util::File::ModificationTime(descriptor_);
  if (descriptor_time) time = std::max(*time, *descriptor_time);
  return time;
}

absl::optional<double> Program::ArtifactTime() const {
  if (!language_.IsCompiled()) return SourceTime();
  return util::File::ModificationTime(executable_);
}

bool Program::NeedsCompilation() const {
  if (!language_.IsCompiled()) return false;
  absl::optional<double> exe_time = util::File::ModificationTime(executable_);
  if (!exe_time) return true;
  absl::optional<double> source_time = SourceTime();
  return source_time && *exe_time < *source_time;
}

void Program::Compile() const {
  if (!language_.IsCompiled()) return;
  if (!util::File::Exists(source_)) {
    throw ConfigurationError("Source " + source_ + " of " + identifier_ +
                             " does not exist");
  }
  LOG(INFO) << "Compiling " << identifier_;
  util::File::MakeDirs(util::File::BaseDir(executable_));
  Execution compilation(
      "Compilation of " + identifier_,
      language_.CompileCommand(source_, executable_, resource_dirs_));
  compilation.WallLimit(FLAGS_compilation_time_limit);
  compilation.Run();
  if (compilation.StatusCode() != 0 || compilation.Signal() != 0 ||
      compilation.Killed()) {
    throw CompilationError(identifier_, compilation.Stderr());
  }
}

void Program::EnsureCompiled() const {
  if (NeedsCompilation()) Compile();
}

std::vector<std::string> Program::ExecuteCommand() const {
  return language_.ExecuteCommand(source_, executable_);
}

}  // namespace core
