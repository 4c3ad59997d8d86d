#include "util/which.hpp"

#include <cstdlib>
#include <fstream>

#include <sys/stat.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/taskprep_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

class Which : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) saved_path_ = path;
  }
  void TearDown() override { setenv("PATH", saved_path_.c_str(), 1); }

 private:
  std::string saved_path_;
};

// NOLINTNEXTLINE
TEST_F(Which, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2", false), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichSkipsNonExecutables) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  { std::ofstream os(tmpdir.Path() + "/data"); }
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("data", false), "");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichKeepsPaths) {
  EXPECT_EQ(util::which("./foo/bar"), "./foo/bar");
  EXPECT_EQ(util::which("/bin/sh"), "/bin/sh");
}

// NOLINTNEXTLINE
TEST_F(Which, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_THROW(util::which("cmd", false), std::exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(Which, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createExecutable(tmpdir1.Path() + "/cached_cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached_cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached_cmd");
  }
  EXPECT_EQ(util::which("cached_cmd"), path);
  EXPECT_EQ(util::which("cached_cmd", false), "");
}

}  // namespace
