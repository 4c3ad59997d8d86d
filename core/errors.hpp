#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace core {

// The problem cannot be built or judged as described: missing or duplicated
// roles, programs that do not compile, tests rejected by a validator.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A compiler exited with a non-zero status.
class CompilationError : public ConfigurationError {
 public:
  CompilationError(const std::string& identifier, const std::string& output)
      : ConfigurationError("Compilation of " + identifier +
                           " failed:\n" + output),
        identifier_(identifier),
        output_(output) {}

  const std::string& Identifier() const { return identifier_; }
  const std::string& Output() const { return output_; }

 private:
  std::string identifier_;
  std::string output_;
};

}  // namespace core

#endif
