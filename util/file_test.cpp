#include "util/file.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/codeeval_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

/*
 * Read and Write
 */

// NOLINTNEXTLINE
TEST(File, WriteThenRead) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/a/b/file";
  std::string content("binary\0data\n", 12);
  util::File::Write(path, content);
  EXPECT_EQ(util::File::Read(path), content);
  EXPECT_EQ(util::File::Size(path), 12);
  util::File::Write(path, "new");
  EXPECT_EQ(util::File::Read(path), "new");
}

// NOLINTNEXTLINE
TEST(File, WriteNoOverwrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::Write(path, "first", false);
  EXPECT_THROW(util::File::Write(path, "second", false),  // NOLINT
               std::system_error);
  EXPECT_EQ(util::File::Read(path), "first");
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::Read(tmp.Path() + "/nope"),  // NOLINT
               util::file_not_found);
  EXPECT_EQ(util::File::Size(tmp.Path() + "/nope"), -1);
}

// NOLINTNEXTLINE
TEST(File, ReadLarge) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/large";
  std::string content(3 * util::kChunkSize + 17, 'x');
  writeFile(path, content);
  EXPECT_EQ(util::File::Read(path), content);
}

/*
 * Directories
 */

// NOLINTNEXTLINE
TEST(File, MakeDirsAndRemoveTree) {
  util::TempDir tmp(test_tmpdir);
  std::string dir = tmp.Path() + "/x/y/z";
  util::File::MakeDirs(dir);
  EXPECT_TRUE(dirExists(dir));
  util::File::MakeDirs(dir);
  writeFile(dir + "/file", "data");
  util::File::RemoveTree(tmp.Path() + "/x");
  EXPECT_FALSE(dirExists(tmp.Path() + "/x"));
}

// NOLINTNEXTLINE
TEST(File, SetMode) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  writeFile(path, "data");
  util::File::SetMode(path, S_IRUSR | S_IXUSR);
  struct stat st {};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, S_IRUSR | S_IXUSR);
  EXPECT_THROW(util::File::SetMode(tmp.Path() + "/nope", 0),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("/a/b", "c/d"), "/a/b/c/d");
  EXPECT_EQ(util::File::JoinPath("a", "/abs"), "/abs");
}

// NOLINTNEXTLINE
TEST(File, AbsolutePath) {
  char cwd[4096];
  ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
  EXPECT_EQ(util::File::AbsolutePath("/usr/bin"), "/usr/bin");
  EXPECT_EQ(util::File::AbsolutePath("./bin/python"),
            std::string(cwd) + "/./bin/python");
  EXPECT_EQ(util::File::AbsolutePath("bin"), std::string(cwd) + "/bin");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b");
  EXPECT_EQ(util::File::BaseDir("/file"), "/");
  EXPECT_EQ(util::File::BaseDir("file"), ".");
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    EXPECT_TRUE(dirExists(path));
    writeFile(path + "/file", "data");
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(dirExists(path));
  util::File::RemoveTree(path);
}

// NOLINTNEXTLINE
TEST(TempDir, Move) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::TempDir moved(std::move(tmp));
    EXPECT_EQ(moved.Path(), path);
  }
  EXPECT_FALSE(dirExists(path));
}

}  // namespace
