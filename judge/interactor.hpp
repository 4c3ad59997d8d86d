#ifndef JUDGE_INTERACTOR_HPP
#define JUDGE_INTERACTOR_HPP

#include <string>

#include "core/execution.hpp"
#include "core/program.hpp"

namespace judge {

// Runs solution connected to interactor: the standard output of each one is
// the standard input of the other. The interactor is started first, in its
// own thread, with arguments (input, transcript). solution must not have
// standard input or output redirected already.
//
// If the solution does not end with OK its outcome is returned unchanged.
// Otherwise the verdict and comment come from the interactor, following the
// checker exit code contract, while time and memory are the solution's.
core::ExecutionOutcome Interact(core::Execution* solution,
                                const core::Program& interactor,
                                const std::string& input,
                                const std::string& transcript);

}  // namespace judge

#endif
