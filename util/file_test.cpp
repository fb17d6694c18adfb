#include "util/file.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

const std::string test_tmpdir = "/tmp/fixbench_testdir";

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

// NOLINTNEXTLINE
TEST(File, WriteAndRead) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "a/b/file.txt");
  util::File::Write(path, std::string("line\0binary\n", 12));
  EXPECT_EQ(util::File::Read(path), std::string("line\0binary\n", 12));
  EXPECT_EQ(util::File::Size(path), 12);
}

// NOLINTNEXTLINE
TEST(File, WriteNoOverwrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "file");
  util::File::Write(path, "first");
  EXPECT_THROW(util::File::Write(path, "second", false),  // NOLINT
               util::file_exists);
  EXPECT_EQ(readFile(path), "first");
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  EXPECT_THROW(util::File::Read(test_tmpdir + "/does/not/exist"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, Append) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "log.jsonl");
  util::File::Append(path, "one\n");
  util::File::Append(path, "two\n");
  EXPECT_EQ(readFile(path), "one\ntwo\n");
}

// NOLINTNEXTLINE
TEST(File, CopyTreeKeepsModesAndLinks) {
  util::TempDir tmp(test_tmpdir);
  std::string src = util::File::JoinPath(tmp.Path(), "src");
  util::File::Write(src + "/pkg/mod.py", "print(1)\n");
  util::File::Write(src + "/run.sh", "#!/bin/sh\n");
  ASSERT_EQ(chmod((src + "/run.sh").c_str(), S_IRWXU), 0);
  ASSERT_EQ(symlink("pkg/mod.py", (src + "/link.py").c_str()), 0);

  std::string dst = util::File::JoinPath(tmp.Path(), "dst");
  util::File::CopyTree(src, dst);
  EXPECT_EQ(readFile(dst + "/pkg/mod.py"), "print(1)\n");
  struct stat st {};
  ASSERT_EQ(stat((dst + "/run.sh").c_str(), &st), 0);
  EXPECT_TRUE(st.st_mode & S_IXUSR);
  char target[64] = {};
  ASSERT_GT(readlink((dst + "/link.py").c_str(), target, sizeof(target) - 1),
            0);
  EXPECT_STREQ(target, "pkg/mod.py");
}

// NOLINTNEXTLINE
TEST(File, JoinPathAndBaseDir) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/abs"), "/abs");
  EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b");
  EXPECT_EQ(util::File::BaseDir("/c"), "/");
  EXPECT_EQ(util::File::BaseDir("c"), "");
}

// NOLINTNEXTLINE
TEST(File, TempDirRemovedUnlessKept) {
  std::string removed;
  std::string kept;
  {
    util::TempDir a(test_tmpdir);
    util::TempDir b(test_tmpdir);
    util::File::Write(a.Path() + "/x", "x");
    removed = a.Path();
    kept = b.Path();
    b.Keep();
  }
  EXPECT_FALSE(util::File::Exists(removed));
  EXPECT_TRUE(util::File::Exists(kept));
  util::File::RemoveTree(kept);
}

}  // namespace
