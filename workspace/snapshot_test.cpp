#include "workspace/snapshot.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/instance.hpp"
#include "proto/conversation.pb.h"
#include "tests/git_repo.hpp"
#include "util/json.hpp"
#include "workspace/view.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

class WorkspaceSnapshotTest : public ::testing::Test {
 protected:
  WorkspaceSnapshotTest()
      : repo_({{"pkg/core.py", "def f():\n    return 1\n"},
               {"pkg/__pycache__/core.cpython-39.pyc", "junk"},
               {"pkg/util.py", "X = 1\n"},
               {"README", "hello\n"}}) {
    sandbox::ProviderOptions options;
    options.temp_directory = tests::kTestTmpDir;
    provider_ = sandbox::IsolationProvider::Create("local", options);
  }

  void SetUp() override {
    sandbox::StartOptions options;
    options.image = repo_.Path();
    options.name = "snapshot-test";
    auto instance = sandbox::ScopedInstance::Start(provider_.get(), options);
    ASSERT_TRUE(instance.ok()) << instance.status();
    instance_ = std::move(*instance);
    executor_.reset(new executor::CommandExecutor(
        provider_.get(), &instance_->instance(), executor::ExecutorOptions()));
    store_.reset(
        new workspace::FileMutationStore(executor_.get(), repo_.Head()));
    extractor_.reset(
        new workspace::PatchExtractor(executor_.get(), repo_.Head()));
  }

  std::unique_ptr<workspace::WorkspaceSnapshot> Snapshot(size_t ceiling) {
    workspace::SnapshotOptions options;
    options.char_ceiling = ceiling;
    return std::unique_ptr<workspace::WorkspaceSnapshot>(
        new workspace::WorkspaceSnapshot(executor_.get(), store_.get(),
                                         extractor_.get(), options));
  }

  tests::GitRepo repo_;
  std::unique_ptr<sandbox::IsolationProvider> provider_;
  std::unique_ptr<sandbox::ScopedInstance> instance_;
  std::unique_ptr<executor::CommandExecutor> executor_;
  std::unique_ptr<workspace::FileMutationStore> store_;
  std::unique_ptr<workspace::PatchExtractor> extractor_;
};

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, ListsFoldersWithoutNoise) {
  proto::WorkspaceView view;
  workspace::OpenDirectory(&view, ".", 2);
  auto text = Snapshot(80000)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text, HasSubstr("./pkg/core.py\n"));
  EXPECT_THAT(*text, HasSubstr("./README\n"));
  EXPECT_THAT(*text, Not(HasSubstr("__pycache__")));
  EXPECT_THAT(*text, Not(HasSubstr(".git")));
  EXPECT_THAT(*text, HasSubstr("No changes yet."));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, FilesRenderedOldestFirstWithLineNumbers) {
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "pkg/core.py");
  workspace::OpenFile(&view, "pkg/util.py");
  auto text = Snapshot(80000)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  size_t core = text->find("## File pkg/core.py");
  size_t util = text->find("## File pkg/util.py");
  ASSERT_NE(core, std::string::npos);
  ASSERT_NE(util, std::string::npos);
  EXPECT_LT(core, util);
  EXPECT_THAT(*text, HasSubstr("     2\t    return 1\n"));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, LongFileIsTruncatedWithoutTail) {
  std::string content(100, 'a');
  content += "TAIL";
  ASSERT_TRUE(store_->Create("big.txt", content).ok());
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "big.txt");
  auto text = Snapshot(50)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text,
              HasSubstr("<<< TRUNCATED: 54 of 104 characters omitted >>>"));
  EXPECT_THAT(*text, Not(HasSubstr("TAIL")));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, TruncationKeepsCharactersWhole) {
  std::string content;
  for (int i = 0; i < 10; i++) content += "\xC3\xA9";
  content += "TAIL";
  ASSERT_TRUE(store_->Create("accents.txt", content).ok());
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "accents.txt");
  auto text = Snapshot(5)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text, HasSubstr("\t\xC3\xA9\xC3\xA9\n"
                               "<<< TRUNCATED: 20 of 24 characters omitted"));
  EXPECT_THAT(*text, Not(HasSubstr("\xEF\xBF\xBD")));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, Latin1ContentSurvivesSerialization) {
  ASSERT_TRUE(store_->Create("latin1.txt", "caf\xE9 au lait\n").ok());
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "latin1.txt");
  auto text = Snapshot(80000)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text, HasSubstr("caf\xEF\xBF\xBD au lait"));

  proto::Message message;
  message.set_content(*text);
  auto json = util::ToJson(message);
  ASSERT_TRUE(json.ok()) << json.status();
  proto::Message parsed;
  ASSERT_TRUE(util::FromJson(*json, &parsed).ok());
  EXPECT_EQ(parsed.content(), *text);
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, MissingFileIsANote) {
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "nope.py");
  auto text = Snapshot(80000)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text, HasSubstr("Cannot show nope.py"));
}

// NOLINTNEXTLINE
TEST_F(WorkspaceSnapshotTest, DiffAndTerminalSessionThenCleared) {
  ASSERT_TRUE(store_->Replace("pkg/util.py", "X = 1", "X = 2").ok());
  proto::WorkspaceView view;
  auto result = executor_->Execute("echo out; echo err >&2; exit 3");
  ASSERT_TRUE(result.ok()) << result.status();
  workspace::RecordCommand(&view, "echo out", *result);

  auto text = Snapshot(80000)->Render(&view);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_THAT(*text, HasSubstr("-X = 1\n+X = 2\n"));
  EXPECT_THAT(*text, HasSubstr("$ echo out\nout\n[stderr]\nerr\n"
                               "[exit code: 3]"));
  EXPECT_EQ(view.terminal_session_size(), 0);
}

// NOLINTNEXTLINE
TEST(TruncateTest, ShortTextUnchanged) {
  EXPECT_EQ(workspace::Truncate("abc", 3), "abc");
  EXPECT_EQ(workspace::Truncate("abcdef", 3),
            "abc\n<<< TRUNCATED: 3 of 6 characters omitted >>>\n");
}

// NOLINTNEXTLINE
TEST(TruncateTest, NeverSplitsACharacter) {
  EXPECT_EQ(workspace::Truncate("ab\xC3\xA9" "cd", 3),
            "ab\n<<< TRUNCATED: 4 of 6 characters omitted >>>\n");
}

}  // namespace
