#ifndef CORE_EXECUTION_HPP
#define CORE_EXECUTION_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/verdict.hpp"
#include "util/pipe.hpp"

namespace core {

// Where a program reads its input or writes its output: either the standard
// stream or a file with the given name in its working directory.
class FileName {
 public:
  static FileName Standard() { return FileName(""); }
  static FileName Named(std::string name) { return FileName(std::move(name)); }

  bool IsStandard() const { return name_.empty(); }
  const std::string& Name() const { return name_; }

 private:
  explicit FileName(std::string name) : name_(std::move(name)) {}
  std::string name_;
};

// A single run of a program. Configure it with the setters, call Run once,
// then read the raw results.
class Execution {
 public:
  Execution(std::string description, std::string executable,
            std::vector<std::string> args);
  explicit Execution(std::string description, std::vector<std::string> argv);

  const std::string& Description() const { return description_; }

  // Input redirection. Paths are read before the program starts.
  void Stdin(const std::string& path) { stdin_file_ = path; }
  void Stdin(util::FileDescriptor fd) { stdin_fd_ = std::move(fd); }
  // Copies path into the working directory as name.
  void Input(const std::string& name, const std::string& path) {
    inputs_[name] = path;
  }
  void Input(const FileName& file, const std::string& path);

  // Output redirection.
  void Stdout(const std::string& path) { stdout_file_ = path; }
  void Stdout(util::FileDescriptor fd) { stdout_fd_ = std::move(fd); }
  // After the run, copies the file name from the working directory to path.
  // A missing file produces an empty path.
  void Output(const std::string& name, const std::string& path) {
    outputs_[name] = path;
  }
  void Output(const FileName& file, const std::string& path);

  // Runs the program in a fresh directory that is removed afterwards.
  void UseTempDirectory() { temp_directory_ = true; }
  // Runs the program in dir. By default the current directory is used.
  void WorkingDirectory(const std::string& dir) { working_directory_ = dir; }

  // The run is classified against limits, and killed after
  // limits.RealTimeLimit() seconds.
  void SetLimits(const Limits& limits) { limits_ = limits; }
  // Kills the program after the given number of seconds without applying
  // time or memory limits.
  void WallLimit(double seconds) { wall_limit_ = seconds; }

  // Runs the program and classifies the result. Both redirected descriptors
  // are closed as soon as the program exits. Throws std::runtime_error if the
  // program cannot be started and std::system_error if its files cannot be
  // prepared.
  ExecutionOutcome Run();

  // To be called after Run().
  int32_t StatusCode() const { return status_code_; }
  int32_t Signal() const { return signal_; }
  bool Killed() const { return killed_; }
  double WallTime() const { return wall_time_; }
  const std::string& Stderr() const { return stderr_; }

  Execution(const Execution&) = delete;
  Execution& operator=(const Execution&) = delete;
  Execution(Execution&&) = default;
  Execution& operator=(Execution&&) = default;
  ~Execution() = default;

 private:
  std::string ResolveExecutable() const;

  std::string description_;
  std::string executable_;
  std::vector<std::string> args_;

  std::string stdin_file_;
  std::string stdout_file_;
  util::FileDescriptor stdin_fd_;
  util::FileDescriptor stdout_fd_;
  std::map<std::string, std::string> inputs_;
  std::map<std::string, std::string> outputs_;

  bool temp_directory_ = false;
  std::string working_directory_;
  absl::optional<Limits> limits_;
  double wall_limit_ = 0;

  int32_t status_code_ = 0;
  int32_t signal_ = 0;
  bool killed_ = false;
  double wall_time_ = 0;
  std::string stderr_;
};

}  // namespace core
#endif
