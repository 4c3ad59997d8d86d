#ifndef JUDGE_JUDGMENT_HPP
#define JUDGE_JUDGMENT_HPP

#include <string>

#include "core/verdict.hpp"

namespace judge {

// What a checker, validator or interactor decided, with its explanation.
struct Judgment {
  core::Verdict verdict = core::Verdict::OK;
  std::string comment;
};

}  // namespace judge

#endif
