#include "judge/judgment_cache.hpp"

#include <stdexcept>

#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "proto/verdict_record.pb.h"
#include "util/file.hpp"

namespace judge {

Dependency Dependency::File(const std::string& path) {
  return Dependency{path, util::File::ModificationTime(path)};
}

bool NeedsRejudge(const absl::optional<double>& cached_at,
                  const std::vector<Dependency>& dependencies) {
  if (!cached_at) return true;
  for (const Dependency& dependency : dependencies) {
    if (!dependency.time) {
      VLOG(1) << dependency.name << " is missing";
      return true;
    }
    if (*dependency.time > *cached_at) {
      VLOG(1) << dependency.name << " changed since the last judgment";
      return true;
    }
  }
  return false;
}

absl::optional<core::ExecutionOutcome> VerdictRecordStore::Load(
    const std::string& path) {
  std::string text;
  try {
    text = util::File::Read(path);
  } catch (const util::file_not_found&) {
    return absl::nullopt;
  }
  proto::VerdictRecord record;
  if (!google::protobuf::TextFormat::ParseFromString(text, &record)) {
    LOG(WARNING) << "Ignoring corrupt verdict record " << path;
    return absl::nullopt;
  }
  try {
    return core::ExecutionOutcome::FromProto(record);
  } catch (const std::invalid_argument& exc) {
    LOG(WARNING) << "Ignoring verdict record " << path << ": " << exc.what();
    return absl::nullopt;
  }
}

void VerdictRecordStore::Save(const std::string& path,
                              const core::ExecutionOutcome& outcome) {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(outcome.ToProto(), &text)) {
    throw std::runtime_error("Cannot serialize verdict record " + path);
  }
  util::File::Write(path, text);
}

absl::optional<double> VerdictRecordStore::CachedAt(const std::string& path) {
  if (!Load(path)) return absl::nullopt;
  return util::File::ModificationTime(path);
}

}  // namespace judge
