#ifndef CORE_LANGUAGE_HPP
#define CORE_LANGUAGE_HPP

#include <string>
#include <vector>

#include "proto/language.pb.h"

namespace core {

class Language {
 public:
  Language() = default;
  explicit Language(proto::Language proto) : proto_(std::move(proto)) {}

  const std::string& Name() const { return proto_.name(); }
  bool IsCompiled() const { return !proto_.compile().empty(); }

  // Compiler command line for src, producing exe, with one -I flag per
  // resource directory in place of {inc}.
  std::vector<std::string> CompileCommand(
      const std::string& src, const std::string& exe,
      const std::vector<std::string>& resource_dirs) const;

  // Command line that runs the program.
  std::vector<std::string> ExecuteCommand(const std::string& src,
                                          const std::string& exe) const;

  // Whether path has one of the autodetect extensions.
  bool Matches(const std::string& path) const;

  const proto::Language& Proto() const { return proto_; }

 private:
  proto::Language proto_;
};

class LanguageTable {
 public:
  // c++03/11/14/17, c99, c11, python2, python3.
  static LanguageTable Default();

  // Parses a text-format proto::LanguageTable. Throws ConfigurationError if
  // the text cannot be parsed.
  static LanguageTable FromText(const std::string& text);
  static LanguageTable FromFile(const std::string& path);

  // The table named by --languages_config, or the default one. Loaded once.
  static const LanguageTable& Configured();

  // Throws ConfigurationError for unknown names.
  const Language& Get(const std::string& name) const;

  // Returns nullptr if no language claims the extension of path.
  const Language* Autodetect(const std::string& path) const;

  void Add(Language language) { languages_.push_back(std::move(language)); }
  size_t Size() const { return languages_.size(); }

 private:
  std::vector<Language> languages_;
};

}  // namespace core
#endif
