#include "util/file.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

using util::File;
using util::TempDir;

class FileTest : public ::testing::Test {
 protected:
  FileTest() : tmp_(FLAGS_temp_directory) {}
  std::string Path(const std::string& name) {
    return File::JoinPath(tmp_.Path(), name);
  }
  TempDir tmp_;
};

/*
 * Read and Write
 */

// NOLINTNEXTLINE
TEST_F(FileTest, WriteThenRead) {
  File::Write(Path("file"), "lallabalalla\n");
  EXPECT_EQ(File::Read(Path("file")), "lallabalalla\n");
}

// NOLINTNEXTLINE
TEST_F(FileTest, BigFile) {
  std::string content(util::kChunkSize * 2 + 1, 'x');
  File::Write(Path("bigfile"), content);
  EXPECT_EQ(File::Read(Path("bigfile")), content);
  EXPECT_EQ(File::Size(Path("bigfile")), static_cast<int64_t>(content.size()));
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadLimit) {
  File::Write(Path("file"), std::string(util::kChunkSize * 2, 'x'));
  EXPECT_EQ(File::Read(Path("file"), 10), std::string(10, 'x'));
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadNoSuchFile) {
  EXPECT_THROW(File::Read(Path("no/such/file")), util::file_not_found);
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteCreatesDirectories) {
  File::Write(Path("wow/such/dir/file"), "");
  EXPECT_TRUE(File::Exists(Path("wow/such/dir/file")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteKeepsPermissions) {
  File::Write(Path("script"), "old");
  ASSERT_EQ(chmod(Path("script").c_str(), 0755), 0);
  File::Write(Path("script"), "new");
  struct stat st {};
  ASSERT_EQ(stat(Path("script").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0755u);
}

/*
 * MakeDirs, Copy and Remove
 */

// NOLINTNEXTLINE
TEST_F(FileTest, MakeDirs) {
  File::MakeDirs(Path("wow/such/dir"));
  EXPECT_TRUE(File::Exists(Path("wow/such/dir")));
  File::MakeDirs(Path("wow/such/dir"));
}

// NOLINTNEXTLINE
TEST_F(FileTest, Copy) {
  File::Write(Path("file"), "hollaaa");
  File::Write(Path("file2"), "This should be overwritten");
  File::Copy(Path("file"), Path("file2"));
  EXPECT_EQ(File::Read(Path("file")), "hollaaa");
  EXPECT_EQ(File::Read(Path("file2")), "hollaaa");
}

// NOLINTNEXTLINE
TEST_F(FileTest, RemoveTree) {
  File::Write(Path("tree/a/b"), "");
  File::Write(Path("tree/c"), "");
  File::RemoveTree(Path("tree"));
  EXPECT_FALSE(File::Exists(Path("tree")));
  EXPECT_THROW(File::Remove(Path("tree")), std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(File::JoinPath("", "b"), "b");
  EXPECT_EQ(File::JoinPath("a", ""), "a");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(File::BaseDir("/a/b/c"), "/a/b");
  EXPECT_EQ(File::BaseDir("/a"), "/");
  EXPECT_EQ(File::BaseDir("a"), ".");
}

/*
 * ModificationTime
 */

// NOLINTNEXTLINE
TEST_F(FileTest, ModificationTime) {
  EXPECT_FALSE(File::ModificationTime(Path("file")).has_value());
  File::Write(Path("file"), "");
  absl::optional<double> time = File::ModificationTime(Path("file"));
  ASSERT_TRUE(time.has_value());
  EXPECT_GT(*time, 0);
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirIsRemoved) {
  std::string path;
  {
    TempDir dir(tmp_.Path());
    path = dir.Path();
    File::Write(File::JoinPath(path, "inner/file"), "");
    EXPECT_TRUE(File::Exists(path));
  }
  EXPECT_FALSE(File::Exists(path));
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempDirKeep) {
  std::string path;
  {
    TempDir dir(tmp_.Path());
    dir.Keep();
    path = dir.Path();
  }
  EXPECT_TRUE(File::Exists(path));
}

}  // namespace
