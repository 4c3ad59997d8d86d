#ifndef JUDGE_GENERATOR_HPP
#define JUDGE_GENERATOR_HPP

#include <string>
#include <vector>

#include "core/program.hpp"

namespace judge {

// Runs generator with args and writes its standard output to destination.
// Throws core::ConfigurationError if the generator does not exit cleanly.
void Generate(const core::Program& generator,
              const std::vector<std::string>& args,
              const std::string& destination);

}  // namespace judge

#endif
