#include "core/language.hpp"

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "core/errors.hpp"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/shell.hpp"

namespace core {

namespace {
const char* kDefaultLanguages = R"(
language {
  name: "c++03"
  compile: "g++ -Wall -O2 -lm -std=c++03 {src} -o {exe} {inc}"
}
language {
  name: "c++11"
  compile: "g++ -Wall -O2 -lm -std=c++11 {src} -o {exe} {inc}"
  autodetect: ".cc"
  autodetect: ".cpp"
}
language {
  name: "c++14"
  compile: "g++ -Wall -O2 -lm -std=c++14 {src} -o {exe} {inc}"
}
language {
  name: "c++17"
  compile: "g++ -Wall -O2 -lm -std=c++17 {src} -o {exe} {inc}"
}
language {
  name: "c99"
  compile: "gcc -Wall -O2 -lm -std=c99 {src} -o {exe} {inc}"
}
language {
  name: "c11"
  compile: "gcc -Wall -O2 -lm -std=c11 {src} -o {exe} {inc}"
  autodetect: ".c"
}
language {
  name: "python2"
  execute: "python2 {src}"
}
language {
  name: "python3"
  execute: "python3 {src}"
  autodetect: ".py"
}
)";

std::vector<std::string> Substitute(
    const std::string& templ, const std::string& src, const std::string& exe,
    const std::vector<std::string>& resource_dirs) {
  std::vector<std::string> command;
  for (const std::string& word : util::ShellSplit(templ)) {
    if (word == "{inc}") {
      for (const std::string& dir : resource_dirs) {
        command.push_back(absl::StrCat("-I", dir));
      }
      continue;
    }
    command.push_back(
        absl::StrReplaceAll(word, {{"{src}", src}, {"{exe}", exe}}));
  }
  return command;
}
}  // namespace

std::vector<std::string> Language::CompileCommand(
    const std::string& src, const std::string& exe,
    const std::vector<std::string>& resource_dirs) const {
  return Substitute(proto_.compile(), src, exe, resource_dirs);
}

std::vector<std::string> Language::ExecuteCommand(
    const std::string& src, const std::string& exe) const {
  const std::string& templ =
      proto_.execute().empty() ? std::string("{exe}") : proto_.execute();
  return Substitute(templ, src, exe, {});
}

bool Language::Matches(const std::string& path) const {
  for (const std::string& ext : proto_.autodetect()) {
    if (absl::EndsWith(path, ext)) return true;
  }
  return false;
}

LanguageTable LanguageTable::Default() { return FromText(kDefaultLanguages); }

LanguageTable LanguageTable::FromText(const std::string& text) {
  proto::LanguageTable table;
  if (!google::protobuf::TextFormat::ParseFromString(text, &table)) {
    throw ConfigurationError("Invalid language table");
  }
  LanguageTable languages;
  for (const proto::Language& language : table.language()) {
    if (language.name().empty()) {
      throw ConfigurationError("Language without a name");
    }
    languages.Add(Language(language));
  }
  return languages;
}

LanguageTable LanguageTable::FromFile(const std::string& path) {
  try {
    return FromText(util::File::Read(path));
  } catch (const ConfigurationError& exc) {
    throw ConfigurationError(absl::StrCat(exc.what(), " in ", path));
  }
}

const LanguageTable& LanguageTable::Configured() {
  static const LanguageTable table = []() {
    if (FLAGS_languages_config.empty()) return Default();
    LOG(INFO) << "Loading languages from " << FLAGS_languages_config;
    return FromFile(FLAGS_languages_config);
  }();
  return table;
}

const Language& LanguageTable::Get(const std::string& name) const {
  for (const Language& language : languages_) {
    if (language.Name() == name) return language;
  }
  throw ConfigurationError("Unknown language " + name);
}

const Language* LanguageTable::Autodetect(const std::string& path) const {
  for (const Language& language : languages_) {
    if (language.Matches(path)) return &language;
  }
  return nullptr;
}

}  // namespace core
