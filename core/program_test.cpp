#include "core/program.hpp"

#include <sys/stat.h>
#include <sys/time.h>

#include "core/errors.hpp"
#include "core/execution.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using core::Language;
using core::LanguageTable;
using core::Program;
using util::File;

// Sets both access and modification time of path.
void SetTime(const std::string& path, double seconds) {
  struct timeval times[2];
  times[0].tv_sec = static_cast<time_t>(seconds);
  times[0].tv_usec = 0;
  times[1] = times[0];
  ASSERT_EQ(utimes(path.c_str(), times), 0);
}

class ProgramTest : public ::testing::Test {
 protected:
  ProgramTest()
      : tmp_(FLAGS_temp_directory),
        languages_(LanguageTable::FromText(R"(
          language { name: "sh" execute: "sh {src}" }
          language { name: "copy" compile: "cp {src} {exe}" execute: "sh {exe}" }
          language { name: "broken" compile: "sh -c 'echo nope >&2; exit 1'" }
        )")) {}

  std::string Path(const std::string& name) {
    return File::JoinPath(tmp_.Path(), name);
  }

  Program Make(const std::string& language, const std::string& descriptor) {
    return Program("prog", Path("prog.sh"), descriptor, Path("bin/prog"),
                   languages_.Get(language));
  }

  util::TempDir tmp_;
  LanguageTable languages_;
};

// NOLINTNEXTLINE
TEST_F(ProgramTest, InterpretedNeverCompiles) {
  File::Write(Path("prog.sh"), "echo hi\n");
  Program program = Make("sh", "");
  EXPECT_FALSE(program.NeedsCompilation());
  program.EnsureCompiled();
  EXPECT_FALSE(File::Exists(Path("bin/prog")));
  EXPECT_EQ(program.ArtifactTime(), File::ModificationTime(Path("prog.sh")));
  EXPECT_THAT(program.ExecuteCommand(), ElementsAre("sh", Path("prog.sh")));
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, CompileWhenMissing) {
  File::Write(Path("prog.sh"), "echo hi\n");
  Program program = Make("copy", "");
  EXPECT_TRUE(program.NeedsCompilation());
  EXPECT_FALSE(program.ArtifactTime().has_value());
  program.EnsureCompiled();
  EXPECT_EQ(File::Read(Path("bin/prog")), "echo hi\n");
  EXPECT_FALSE(program.NeedsCompilation());
  EXPECT_TRUE(program.ArtifactTime().has_value());
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, RecompileWhenSourceIsNewer) {
  File::Write(Path("prog.sh"), "echo old\n");
  Program program = Make("copy", "");
  program.EnsureCompiled();
  SetTime(Path("bin/prog"), 1000);
  SetTime(Path("prog.sh"), 2000);
  EXPECT_TRUE(program.NeedsCompilation());
  File::Write(Path("prog.sh"), "echo new\n");
  program.EnsureCompiled();
  EXPECT_EQ(File::Read(Path("bin/prog")), "echo new\n");
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, RecompileWhenDescriptorIsNewer) {
  File::Write(Path("prog.sh"), "echo hi\n");
  File::Write(Path("prog.desc"), "language: copy\n");
  Program program = Make("copy", Path("prog.desc"));
  program.EnsureCompiled();
  SetTime(Path("prog.sh"), 1000);
  SetTime(Path("bin/prog"), 2000);
  SetTime(Path("prog.desc"), 1500);
  EXPECT_FALSE(program.NeedsCompilation());
  SetTime(Path("prog.desc"), 2500);
  EXPECT_TRUE(program.NeedsCompilation());
  EXPECT_EQ(program.SourceTime(), 2500);
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, SameTimeIsFresh) {
  File::Write(Path("prog.sh"), "echo hi\n");
  Program program = Make("copy", "");
  program.EnsureCompiled();
  SetTime(Path("prog.sh"), 1000);
  SetTime(Path("bin/prog"), 1000);
  EXPECT_FALSE(program.NeedsCompilation());
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, CompilationError) {
  File::Write(Path("prog.sh"), "echo hi\n");
  Program program = Make("broken", "");
  try {
    program.Compile();
    FAIL() << "Compilation should fail";
  } catch (const core::CompilationError& exc) {
    EXPECT_EQ(exc.Identifier(), "prog");
    EXPECT_THAT(exc.Output(), HasSubstr("nope"));
    EXPECT_THAT(exc.what(), HasSubstr("prog"));
  }
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, MissingSource) {
  Program program = Make("copy", "");
  EXPECT_THROW(program.Compile(), core::ConfigurationError);
}

// NOLINTNEXTLINE
TEST_F(ProgramTest, RunsCompiledProgram) {
  File::Write(Path("prog.sh"), "echo compiled\n");
  Program program = Make("copy", "");
  program.EnsureCompiled();
  core::Execution execution("prog", program.ExecuteCommand());
  execution.Stdout(Path("out"));
  EXPECT_EQ(execution.Run().verdict, core::Verdict::OK);
  EXPECT_EQ(File::Read(Path("out")), "compiled\n");
}

}  // namespace
