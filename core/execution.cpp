#include "core/execution.hpp"

#include <errno.h>
#include <limits.h>
#include <unistd.h>

#include <memory>
#include <stdexcept>
#include <system_error>

#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace core {

namespace {
const int64_t kStderrLimit = 1024 * 1024;

std::string CurrentDirectory() {
  char buf[PATH_MAX] = {};
  if (getcwd(buf, PATH_MAX) == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return buf;
}
}  // namespace

Execution::Execution(std::string description, std::string executable,
                     std::vector<std::string> args)
    : description_(std::move(description)),
      executable_(std::move(executable)),
      args_(std::move(args)) {}

Execution::Execution(std::string description, std::vector<std::string> argv)
    : description_(std::move(description)) {
  if (argv.empty()) {
    throw std::invalid_argument("Empty command for " + description_);
  }
  executable_ = argv[0];
  args_.assign(argv.begin() + 1, argv.end());
}

void Execution::Input(const FileName& file, const std::string& path) {
  if (file.IsStandard()) {
    Stdin(path);
  } else {
    Input(file.Name(), path);
  }
}

void Execution::Output(const FileName& file, const std::string& path) {
  if (file.IsStandard()) {
    Stdout(path);
  } else {
    Output(file.Name(), path);
  }
}

std::string Execution::ResolveExecutable() const {
  std::string path = executable_;
  if (path.find('/') == std::string::npos) {
    path = util::which(executable_);
    if (path.empty()) {
      throw std::runtime_error("Cannot find " + executable_ + " for " +
                               description_);
    }
  } else if (path[0] != '/') {
    path = util::File::JoinPath(CurrentDirectory(), path);
  }
  if (access(path.c_str(), X_OK) == -1) {
    throw std::runtime_error("Cannot execute " + path + " for " +
                             description_);
  }
  return path;
}

ExecutionOutcome Execution::Run() {
  // Taken over here so that they are closed on every path out of Run.
  util::FileDescriptor stdin_fd = std::move(stdin_fd_);
  util::FileDescriptor stdout_fd = std::move(stdout_fd_);

  std::unique_ptr<sandbox::Sandbox> sandbox = sandbox::Sandbox::Create();
  if (!sandbox) throw std::runtime_error("No sandbox available");

  util::TempDir box(FLAGS_temp_directory);
  if (FLAGS_keep_sandboxes) {
    box.Keep();
    LOG(INFO) << "Keeping sandbox of " << description_ << " in " << box.Path();
  }
  std::string cwd = working_directory_;
  if (temp_directory_) {
    cwd = util::File::JoinPath(box.Path(), "cwd");
    util::File::MakeDirs(cwd);
  }
  std::string stderr_file = util::File::JoinPath(box.Path(), "stderr");

  for (const auto& input : inputs_) {
    util::File::Copy(input.second,
                     util::File::JoinPath(cwd.empty() ? "." : cwd,
                                          input.first));
  }
  if (!stdout_file_.empty()) {
    util::File::MakeDirs(util::File::BaseDir(stdout_file_));
  }

  sandbox::ExecutionOptions options(cwd, ResolveExecutable());
  options.args = args_;
  options.stdin_file = stdin_file_;
  options.stdout_file = stdout_file_;
  options.stderr_file = stderr_file;
  options.stdin_fd = stdin_fd.Get();
  options.stdout_fd = stdout_fd.Get();
  double wall_limit = limits_ ? limits_->RealTimeLimit() : wall_limit_;
  options.wall_limit_millis = static_cast<int64_t>(wall_limit * 1000);

  VLOG(1) << "Running " << description_ << ": " << options.executable;
  sandbox::ExecutionInfo info;
  std::string error_msg;
  bool started = sandbox->Execute(options, &info, &error_msg);
  stdin_fd.Close();
  stdout_fd.Close();
  if (!started) {
    throw std::runtime_error("Cannot run " + description_ + ": " + error_msg);
  }

  for (const auto& output : outputs_) {
    std::string produced =
        util::File::JoinPath(cwd.empty() ? "." : cwd, output.first);
    if (util::File::Exists(produced)) {
      util::File::Copy(produced, output.second);
    } else {
      util::File::Write(output.second, "");
    }
  }
  if (util::File::Exists(stderr_file)) {
    stderr_ = util::File::Read(stderr_file, kStderrLimit);
  }

  status_code_ = info.status_code;
  signal_ = info.signal;
  killed_ = info.killed;
  wall_time_ = info.wall_time_millis / 1000.0;

  ExecutionOutcome outcome;
  outcome.time = (info.cpu_time_millis + info.sys_time_millis) / 1000.0;
  outcome.memory = info.memory_usage_kb / 1024.0;
  if (killed_) {
    outcome.verdict = Verdict::REAL_TIME_LIMIT_EXCEEDED;
  } else if (status_code_ != 0 || signal_ != 0) {
    outcome.verdict = Verdict::RUNTIME_ERROR;
  } else if (limits_ && outcome.time > limits_->time_limit) {
    outcome.verdict = Verdict::TIME_LIMIT_EXCEEDED;
  } else if (limits_ && outcome.memory > limits_->memory_limit) {
    outcome.verdict = Verdict::MEMORY_LIMIT_EXCEEDED;
  } else {
    outcome.verdict = Verdict::OK;
  }
  VLOG(1) << description_ << ": " << outcome.verdict << " " << outcome.time
          << "s " << outcome.memory << "MiB";
  return outcome;
}

}  // namespace core
