#include "manager/stress.hpp"

#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tests/sum_problem.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

using core::Verdict;
using manager::JudgeContext;
using manager::Problem;
using manager::Solution;
using manager::SolutionTag;
using manager::Stress;
using manager::StressResult;
using testing_programs::ShellProgram;
using util::File;

class StressTest : public ::testing::Test {
 protected:
  StressTest()
      : tmp_(FLAGS_temp_directory),
        problem_(testing_programs::SumProblem(tmp_.Path())) {}
  std::vector<StressResult> Run(const std::string& command,
                                const std::vector<std::string>& candidates =
                                    {}) {
    JudgeContext context = JudgeContext::Create(problem_);
    return Stress(context, command, candidates);
  }
  std::string Path(const std::string& name) {
    return File::JoinPath(tmp_.Path(), name);
  }
  util::TempDir tmp_;
  Problem problem_;
};

// NOLINTNEXTLINE
TEST_F(StressTest, FindsCounterexample) {
  problem_.solutions[2].tag = SolutionTag::Correct();
  std::vector<StressResult> results = Run("gen [0..3] 0");
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].solution, "correct");
  EXPECT_THAT(results[0].verdicts, ElementsAre(Verdict::OK));
  EXPECT_FALSE(results[0].counterexample.has_value());
  EXPECT_EQ(results[1].solution, "wrong");
  EXPECT_THAT(results[1].verdicts, ElementsAre(Verdict::OK));
  EXPECT_FALSE(results[1].counterexample.has_value());

  results = Run("gen 1 [0..3]");
  EXPECT_THAT(results[1].verdicts,
              UnorderedElementsAre(Verdict::OK, Verdict::WRONG_ANSWER));
  ASSERT_TRUE(results[1].counterexample.has_value());
  EXPECT_EQ(*results[1].counterexample, "gen 1 1");
}

// NOLINTNEXTLINE
TEST_F(StressTest, DroppedCandidateIsNotJudgedAgain) {
  // Fails once b is 1, then crashes from b = 2 on.
  problem_.solutions.push_back(Solution{
      ShellProgram(tmp_.Path(), "fragile",
                   "read a b\n[ $b -ge 2 ] && exit 1\necho $((a - b))\n"),
      SolutionTag::Correct()});
  problem_.solutions[2].tag = SolutionTag::Correct();
  std::vector<StressResult> results =
      Run("gen 5 [0..4]", {"fragile", "wrong"});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].solution, "fragile");
  EXPECT_THAT(results[0].verdicts,
              UnorderedElementsAre(Verdict::OK, Verdict::WRONG_ANSWER));
  EXPECT_EQ(*results[0].counterexample, "gen 5 1");
  EXPECT_EQ(*results[1].counterexample, "gen 5 1");
}

// NOLINTNEXTLINE
TEST_F(StressTest, AllowedVerdictsAreKept) {
  std::vector<StressResult> results = Run("gen [1..3] [1..2]", {"wrong"});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_THAT(results[0].verdicts, ElementsAre(Verdict::WRONG_ANSWER));
  EXPECT_FALSE(results[0].counterexample.has_value());
}

// NOLINTNEXTLINE
TEST_F(StressTest, KeepsJudgingOthersAfterADrop) {
  problem_.solutions[2].tag = SolutionTag::Correct();
  std::vector<StressResult> results = Run("gen 2 [0..2]");
  EXPECT_THAT(results[0].verdicts, ElementsAre(Verdict::OK));
  EXPECT_FALSE(results[0].counterexample.has_value());
  EXPECT_THAT(results[1].verdicts,
              UnorderedElementsAre(Verdict::OK, Verdict::WRONG_ANSWER));
  EXPECT_EQ(*results[1].counterexample, "gen 2 1");
}

// NOLINTNEXTLINE
TEST_F(StressTest, LeavesNoCache) {
  Run("gen [1..2] 3");
  // Only the build of the problem itself is on disk.
  EXPECT_TRUE(File::Exists(Path("build/verdicts/main/02")));
  EXPECT_FALSE(File::Exists(Path("build/tests/01")));
  EXPECT_FALSE(File::Exists(Path("build/outputs/wrong")));
  EXPECT_FALSE(File::Exists(Path("build/verdicts/wrong")));
  EXPECT_FALSE(File::Exists(Path("build/verdicts/correct")));
}

// NOLINTNEXTLINE
TEST_F(StressTest, BrokenProblemIsNotStressed) {
  File::Write(problem_.solutions[0].program.Source(), "exit 1\n");
  EXPECT_THROW(Run("gen [1..2] 3"), core::ConfigurationError);
  EXPECT_FALSE(File::Exists(Path("build/outputs/wrong")));
  EXPECT_FALSE(File::Exists(Path("build/outputs/correct")));

  problem_ = testing_programs::SumProblem(tmp_.Path());
  problem_.checker = absl::nullopt;
  EXPECT_THROW(Run("gen 1 1"), core::ConfigurationError);
}

// NOLINTNEXTLINE
TEST_F(StressTest, UnknownCandidate) {
  EXPECT_THROW(Run("gen 1 1", {"nobody"}), core::ConfigurationError);
}

// NOLINTNEXTLINE
TEST_F(StressTest, MalformedTemplate) {
  EXPECT_THROW(Run("gen [3..1] 1"), std::invalid_argument);
}

}  // namespace
