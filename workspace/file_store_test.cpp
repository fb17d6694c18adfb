#include "workspace/file_store.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/instance.hpp"
#include "tests/git_repo.hpp"
#include "util/status.hpp"

namespace {

using ::testing::HasSubstr;

const char* const kOriginal =
    "def add(a, b):\n"
    "    return a - b\n"
    "\n"
    "def sub(a, b):\n"
    "    return a - b\n";

class FileMutationStoreTest : public ::testing::Test {
 protected:
  FileMutationStoreTest()
      : repo_({{"calc.py", kOriginal},
               {"odd.txt", "quote ' dollar $HOME back\\slash `tick`"}}) {
    sandbox::ProviderOptions options;
    options.temp_directory = tests::kTestTmpDir;
    provider_ = sandbox::IsolationProvider::Create("local", options);
  }

  void SetUp() override {
    sandbox::StartOptions options;
    options.image = repo_.Path();
    options.name = "file-store-test";
    auto instance = sandbox::ScopedInstance::Start(provider_.get(), options);
    ASSERT_TRUE(instance.ok()) << instance.status();
    instance_ = std::move(*instance);
    executor_.reset(new executor::CommandExecutor(
        provider_.get(), &instance_->instance(), executor::ExecutorOptions()));
    store_.reset(new workspace::FileMutationStore(executor_.get(),
                                                  repo_.Head(), 16));
  }

  std::string HostPath(const std::string& path) {
    return util::File::JoinPath(instance_->instance().host_root, path);
  }
  std::string Content(const std::string& path) {
    return util::File::Read(HostPath(path));
  }

  tests::GitRepo repo_;
  std::unique_ptr<sandbox::IsolationProvider> provider_;
  std::unique_ptr<sandbox::ScopedInstance> instance_;
  std::unique_ptr<executor::CommandExecutor> executor_;
  std::unique_ptr<workspace::FileMutationStore> store_;
};

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ReplaceThenUndoRestoresBytes) {
  absl::Status status =
      store_->Replace("calc.py", "def add(a, b):\n    return a - b",
                      "def add(a, b):\n    return a + b");
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(Content("calc.py"), HasSubstr("return a + b"));
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 1u);

  ASSERT_TRUE(store_->Undo("calc.py").ok());
  EXPECT_EQ(Content("calc.py"), kOriginal);
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 0u);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, SpecialCharactersSurvive) {
  std::string before = Content("odd.txt");
  ASSERT_TRUE(store_->Replace("odd.txt", "dollar", "'\"$(rm -rf .)\"'").ok());
  EXPECT_EQ(Content("odd.txt"),
            "quote ' '\"$(rm -rf .)\"' $HOME back\\slash `tick`");
  ASSERT_TRUE(store_->Undo("odd.txt").ok());
  EXPECT_EQ(Content("odd.txt"), before);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ReplaceNotFound) {
  absl::Status status = store_->Replace("calc.py", "return a * b", "x");
  EXPECT_EQ(util::GetErrorKind(status),
            util::ErrorKind::kFileMutationConflict);
  EXPECT_EQ(Content("calc.py"), kOriginal);
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 0u);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ReplaceAmbiguousReportsLines) {
  absl::Status status = store_->Replace("calc.py", "return a - b", "x");
  EXPECT_EQ(util::GetErrorKind(status),
            util::ErrorKind::kFileMutationConflict);
  EXPECT_THAT(std::string(status.message()), HasSubstr("lines 2, 5"));
  EXPECT_EQ(Content("calc.py"), kOriginal);
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 0u);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, OverlappingMatchesCountOnce) {
  ASSERT_TRUE(store_->Create("runs.txt", "aaa", false).ok());
  absl::Status status = store_->Replace("runs.txt", "aa", "b");
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ(Content("runs.txt"), "ba");

  ASSERT_TRUE(store_->Create("pairs.txt", "aaaa", false).ok());
  status = store_->Replace("pairs.txt", "aa", "b");
  EXPECT_EQ(util::GetErrorKind(status),
            util::ErrorKind::kFileMutationConflict);
  EXPECT_THAT(std::string(status.message()), HasSubstr("occurs 2 times"));
  EXPECT_EQ(Content("pairs.txt"), "aaaa");
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, InsertRange) {
  // calc.py has 5 lines.
  for (int64_t line : {0, 7, -1}) {
    absl::Status status = store_->Insert("calc.py", line, "# x\n");
    EXPECT_EQ(util::GetErrorKind(status),
              util::ErrorKind::kFileMutationConflict)
        << line;
  }
  EXPECT_EQ(Content("calc.py"), kOriginal);

  ASSERT_TRUE(store_->Insert("calc.py", 6, "# end").ok());
  EXPECT_EQ(Content("calc.py"), std::string(kOriginal) + "# end\n");
  ASSERT_TRUE(store_->Insert("calc.py", 1, "import os\n").ok());
  EXPECT_EQ(Content("calc.py"),
            "import os\n" + std::string(kOriginal) + "# end\n");
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 2u);

  ASSERT_TRUE(store_->Undo("calc.py").ok());
  ASSERT_TRUE(store_->Undo("calc.py").ok());
  EXPECT_EQ(Content("calc.py"), kOriginal);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, CreateRefusesExisting) {
  absl::Status status = store_->Create("calc.py", "x = 1\n");
  EXPECT_EQ(util::GetErrorKind(status),
            util::ErrorKind::kFileMutationConflict);
  EXPECT_THAT(std::string(status.message()), HasSubstr("str_replace"));
  EXPECT_EQ(Content("calc.py"), kOriginal);

  ASSERT_TRUE(store_->Create("calc.py", "x = 1\n", true).ok());
  EXPECT_EQ(Content("calc.py"), "x = 1\n");
  ASSERT_TRUE(store_->Undo("calc.py").ok());
  EXPECT_EQ(Content("calc.py"), kOriginal);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, CreateNewFileAndUndoRemovesIt) {
  std::string content;
  for (int i = 0; i < 50; i++) content += "line " + std::to_string(i) + "\n";
  ASSERT_TRUE(store_->Create("pkg/deep/new.py", content).ok());
  EXPECT_EQ(Content("pkg/deep/new.py"), content);
  auto read = store_->Read("pkg/deep/new.py");
  ASSERT_TRUE(read.ok());
  EXPECT_EQ(*read, content);

  ASSERT_TRUE(store_->Undo("pkg/deep/new.py").ok());
  EXPECT_FALSE(util::File::Exists(HostPath("pkg/deep/new.py")));
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, UndoWithoutHistory) {
  EXPECT_EQ(util::GetErrorKind(store_->Undo("calc.py")),
            util::ErrorKind::kFileMutationConflict);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ResetRestoresBaselineAndClearsHistory) {
  ASSERT_TRUE(store_->Replace("calc.py", "def sub", "def subtract").ok());
  ASSERT_TRUE(store_->Insert("calc.py", 1, "# header").ok());
  ASSERT_TRUE(store_->Reset("calc.py").ok());
  EXPECT_EQ(Content("calc.py"), kOriginal);
  EXPECT_EQ(store_->HistoryDepth("calc.py"), 0u);
  EXPECT_EQ(util::GetErrorKind(store_->Undo("calc.py")),
            util::ErrorKind::kFileMutationConflict);
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ResetRemovesFilesOutsideBaseline) {
  ASSERT_TRUE(store_->Create("scratch.py", "print(1)\n").ok());
  ASSERT_TRUE(store_->Reset("scratch.py").ok());
  EXPECT_FALSE(util::File::Exists(HostPath("scratch.py")));
}

// NOLINTNEXTLINE
TEST_F(FileMutationStoreTest, ReadMissingAndDirectory) {
  EXPECT_EQ(util::GetErrorKind(store_->Read("nope.py").status()),
            util::ErrorKind::kFileMutationConflict);
  ASSERT_TRUE(store_->Create("dir/a.txt", "a").ok());
  EXPECT_EQ(util::GetErrorKind(store_->Replace("dir", "a", "b")),
            util::ErrorKind::kFileMutationConflict);
}

}  // namespace
