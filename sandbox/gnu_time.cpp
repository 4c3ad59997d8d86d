#include "sandbox/gnu_time.hpp"

#include <string.h>
#include <unistd.h>

#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {
const char* kSignalPrefix = "Command terminated by signal ";
const char* kStatusPrefix = "Command exited with non-zero status ";
}  // namespace

namespace sandbox {

const char* const GnuTime::kFormat =
    "user: %U\nsystem: %S\nreal: %e\nmemory: %M";

int GnuTime::Score() {
  if (FLAGS_time_binary.empty()) return -1;
  return access(FLAGS_time_binary.c_str(), X_OK) == 0 ? 3 : -1;
}

bool GnuTime::ParseReport(const std::string& report, ExecutionInfo* info) {
  double user = -1;
  double system = -1;
  int64_t memory = -1;
  for (absl::string_view line :
       absl::StrSplit(report, '\n', absl::SkipWhitespace())) {
    int32_t value = 0;
    if (absl::StartsWith(line, kSignalPrefix) &&
        absl::SimpleAtoi(line.substr(strlen(kSignalPrefix)), &value)) {
      info->signal = value;
      info->status_code = 0;
      continue;
    }
    if (absl::StartsWith(line, kStatusPrefix) &&
        absl::SimpleAtoi(line.substr(strlen(kStatusPrefix)), &value)) {
      info->status_code = value;
      continue;
    }
    std::vector<absl::string_view> kv =
        absl::StrSplit(line, absl::MaxSplits(": ", 1));
    if (kv.size() != 2) continue;
    if (kv[0] == "user") {
      if (!absl::SimpleAtod(kv[1], &user)) return false;
    } else if (kv[0] == "system") {
      if (!absl::SimpleAtod(kv[1], &system)) return false;
    } else if (kv[0] == "memory") {
      if (!absl::SimpleAtoi(kv[1], &memory)) return false;
    }
  }
  if (user < 0 || system < 0 || memory < 0) return false;
  info->cpu_time_millis = static_cast<int64_t>(user * 1000 + 0.5);
  info->sys_time_millis = static_cast<int64_t>(system * 1000 + 0.5);
  info->memory_usage_kb = memory;
  return true;
}

bool GnuTime::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                      std::string* error_msg) {
  util::TempDir scratch(FLAGS_temp_directory);
  std::string report_path = util::File::JoinPath(scratch.Path(), "report");

  ExecutionOptions wrapped = options;
  wrapped.executable = FLAGS_time_binary;
  // GNU time searches PATH for names without a slash.
  std::string executable = options.executable;
  if (executable.find('/') == std::string::npos) executable = "./" + executable;
  wrapped.args = {"-f", kFormat, "-o", report_path, executable};
  wrapped.args.insert(wrapped.args.end(), options.args.begin(),
                      options.args.end());

  if (!Unix::Execute(wrapped, info, error_msg)) return false;
  if (info->killed) return true;

  std::string report;
  try {
    report = util::File::Read(report_path);
  } catch (const util::file_not_found&) {
    VLOG(1) << "No report from " << FLAGS_time_binary;
    return true;
  }
  if (!ParseReport(report, info)) {
    LOG(WARNING) << "Cannot parse the report of " << FLAGS_time_binary << ": "
                 << report;
  }
  return true;
}

namespace {
Sandbox::Register<GnuTime> r;
}  // namespace

}  // namespace sandbox
