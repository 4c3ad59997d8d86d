#include "core/verdict.hpp"

#include <stdexcept>

namespace core {

namespace {
struct VerdictCode {
  Verdict verdict;
  const char* name;
};

const VerdictCode kCodes[] = {
    {Verdict::OK, "OK"},
    {Verdict::TIME_LIMIT_EXCEEDED, "TL"},
    {Verdict::REAL_TIME_LIMIT_EXCEEDED, "RL"},
    {Verdict::MEMORY_LIMIT_EXCEEDED, "ML"},
    {Verdict::RUNTIME_ERROR, "RE"},
    {Verdict::VALIDATION_FAILED, "VF"},
    {Verdict::CHECK_FAILED, "CF"},
    {Verdict::WRONG_ANSWER, "WA"},
    {Verdict::PRESENTATION_ERROR, "PE"},
};
}  // namespace

const char* VerdictName(Verdict verdict) {
  for (const VerdictCode& code : kCodes) {
    if (code.verdict == verdict) return code.name;
  }
  return "??";
}

bool VerdictFromName(const std::string& name, Verdict* verdict) {
  for (const VerdictCode& code : kCodes) {
    if (name == code.name) {
      *verdict = code.verdict;
      return true;
    }
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, Verdict verdict) {
  return os << VerdictName(verdict);
}

Verdict VerdictFromCheckerExitCode(int exit_code) {
  switch (exit_code) {
    case 0:
      return Verdict::OK;
    case 1:
      return Verdict::WRONG_ANSWER;
    case 2:
      return Verdict::PRESENTATION_ERROR;
    default:
      return Verdict::CHECK_FAILED;
  }
}

Verdict VerdictFromValidatorExitCode(int exit_code) {
  return exit_code == 0 ? Verdict::OK : Verdict::VALIDATION_FAILED;
}

proto::VerdictRecord ExecutionOutcome::ToProto() const {
  proto::VerdictRecord record;
  record.set_verdict(VerdictName(verdict));
  record.set_time(time);
  record.set_memory(memory);
  record.set_comment(comment);
  return record;
}

ExecutionOutcome ExecutionOutcome::FromProto(
    const proto::VerdictRecord& record) {
  ExecutionOutcome outcome;
  if (!VerdictFromName(record.verdict(), &outcome.verdict)) {
    throw std::invalid_argument("Unknown verdict " + record.verdict());
  }
  outcome.time = record.time();
  outcome.memory = record.memory();
  outcome.comment = record.comment();
  return outcome;
}

bool operator==(const ExecutionOutcome& a, const ExecutionOutcome& b) {
  return a.verdict == b.verdict && a.time == b.time && a.memory == b.memory &&
         a.comment == b.comment;
}

}  // namespace core
