#ifndef JUDGE_JUDGMENT_CACHE_HPP
#define JUDGE_JUDGMENT_CACHE_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/verdict.hpp"

namespace judge {

// Something a judgment was computed from, with its modification time. An
// empty time means the dependency does not exist.
struct Dependency {
  std::string name;
  absl::optional<double> time;

  // Reads the modification time of path.
  static Dependency File(const std::string& path);
};

// A judgment cached at cached_at is stale if there is no cached judgment,
// if a dependency is missing, or if a dependency was modified after it.
bool NeedsRejudge(const absl::optional<double>& cached_at,
                  const std::vector<Dependency>& dependencies);

// Verdict records, stored in protobuf text format. The modification time of
// the record is the time of the judgment.
class VerdictRecordStore {
 public:
  // Returns the stored outcome, or nothing if the record is missing or
  // cannot be parsed.
  static absl::optional<core::ExecutionOutcome> Load(const std::string& path);

  static void Save(const std::string& path,
                   const core::ExecutionOutcome& outcome);

  // Time of the judgment stored at path, if there is a readable one.
  static absl::optional<double> CachedAt(const std::string& path);
};

}  // namespace judge

#endif
