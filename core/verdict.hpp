#ifndef CORE_VERDICT_HPP
#define CORE_VERDICT_HPP

#include <ostream>
#include <string>

#include "proto/verdict_record.pb.h"

namespace core {

enum class Verdict {
  OK,
  TIME_LIMIT_EXCEEDED,
  REAL_TIME_LIMIT_EXCEEDED,
  MEMORY_LIMIT_EXCEEDED,
  RUNTIME_ERROR,
  VALIDATION_FAILED,
  CHECK_FAILED,
  WRONG_ANSWER,
  PRESENTATION_ERROR,
};

// Short code used in records and logs (OK, TL, RL, ML, RE, VF, CF, WA, PE).
const char* VerdictName(Verdict verdict);

// Inverse of VerdictName. Returns false for unknown codes.
bool VerdictFromName(const std::string& name, Verdict* verdict);

std::ostream& operator<<(std::ostream& os, Verdict verdict);

// Exit code contract of checkers and interactors: 0 is OK, 1 is WRONG_ANSWER,
// 2 is PRESENTATION_ERROR, anything else is CHECK_FAILED.
Verdict VerdictFromCheckerExitCode(int exit_code);

// Exit code contract of validators: 0 is OK, anything else is
// VALIDATION_FAILED.
Verdict VerdictFromValidatorExitCode(int exit_code);

struct Limits {
  // Seconds of user plus system CPU time.
  double time_limit = 1.0;
  // MiB of peak resident memory.
  double memory_limit = 256.0;

  // Wall clock cutoff after which the program is killed.
  double RealTimeLimit() const { return 5 * time_limit; }
};

struct ExecutionOutcome {
  Verdict verdict = Verdict::OK;
  // Seconds.
  double time = 0;
  // MiB.
  double memory = 0;
  std::string comment;

  proto::VerdictRecord ToProto() const;
  // Throws std::invalid_argument on an unknown verdict code.
  static ExecutionOutcome FromProto(const proto::VerdictRecord& record);
};

bool operator==(const ExecutionOutcome& a, const ExecutionOutcome& b);

}  // namespace core

#endif
