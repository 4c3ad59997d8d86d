#ifndef SANDBOX_GNU_TIME_HPP
#define SANDBOX_GNU_TIME_HPP
#include <string>

#include "sandbox/unix.hpp"

namespace sandbox {

// Runs the program through GNU time (--time_binary) and takes CPU time and
// peak memory from its report. Falls back to the measurements of the Unix
// sandbox when no report is produced, for example after a wall limit kill.
class GnuTime : public Unix {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new GnuTime(); }
  static int Score();

  // Output format passed to GNU time.
  static const char* const kFormat;

  // Updates info with the values found in a report written with kFormat.
  // Returns false if the report does not contain all of them.
  static bool ParseReport(const std::string& report, ExecutionInfo* info);

 protected:
  GnuTime() = default;
};

}  // namespace sandbox
#endif
