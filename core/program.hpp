#ifndef CORE_PROGRAM_HPP
#define CORE_PROGRAM_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/language.hpp"

namespace core {

// A source file that can be compiled and run. The role of the program
// (checker, validator, generator, interactor, solution) is given by the
// functions that use it.
class Program {
 public:
  Program() = default;
  // descriptor may be empty if the program has none.
  Program(std::string identifier, std::string source, std::string descriptor,
          std::string executable, Language language,
          std::vector<std::string> resource_dirs = {});

  const std::string& Identifier() const { return identifier_; }
  const std::string& Source() const { return source_; }
  const std::string& Descriptor() const { return descriptor_; }
  const std::string& Executable() const { return executable_; }
  const Language& Lang() const { return language_; }
  const std::vector<std::string>& ResourceDirs() const {
    return resource_dirs_;
  }

  // Latest modification time of the source and of the descriptor. Empty if
  // the source does not exist.
  absl::optional<double> SourceTime() const;

  // Modification time of what gets executed: the compiled executable, or the
  // source for interpreted languages.
  absl::optional<double> ArtifactTime() const;

  // True if the executable is missing or older than the source or the
  // descriptor. Always false for interpreted languages.
  bool NeedsCompilation() const;

  // Compiles unconditionally. Throws CompilationError if the compiler fails
  // and ConfigurationError if the source is missing.
  void Compile() const;

  // Compiles if NeedsCompilation().
  void EnsureCompiled() const;

  // Command line that runs the program.
  std::vector<std::string> ExecuteCommand() const;

 private:
  std::string identifier_;
  std::string source_;
  std::string descriptor_;
  std::string executable_;
  Language language_;
  std::vector<std::string> resource_dirs_;
};

}  // namespace core
#endif
