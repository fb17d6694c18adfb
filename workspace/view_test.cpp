#include "workspace/view.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tests/git_repo.hpp"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

// NOLINTNEXTLINE
TEST(WorkspaceViewTest, OpenFileMovesToFront) {
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "a.py");
  workspace::OpenFile(&view, "b.py");
  workspace::OpenFile(&view, "c.py");
  workspace::OpenFile(&view, "a.py");
  EXPECT_THAT(view.open_files(), ElementsAre("a.py", "c.py", "b.py"));
  EXPECT_TRUE(workspace::CloseFile(&view, "c.py"));
  EXPECT_FALSE(workspace::CloseFile(&view, "c.py"));
  EXPECT_THAT(view.open_files(), ElementsAre("a.py", "b.py"));
}

// NOLINTNEXTLINE
TEST(WorkspaceViewTest, DirectoriesKeepLatestDepth) {
  proto::WorkspaceView view;
  workspace::OpenDirectory(&view, "src", 2);
  workspace::OpenDirectory(&view, "src", 0);
  EXPECT_EQ(view.open_directories().at("src"), 1);
  EXPECT_TRUE(workspace::CloseDirectory(&view, "src"));
  EXPECT_FALSE(workspace::CloseDirectory(&view, "src"));
}

// NOLINTNEXTLINE
TEST(WorkspaceViewTest, UpdateReportKeepsUnsetFields) {
  proto::WorkspaceView view;
  proto::WorkspaceReport first;
  first.add_checklist("reproduce");
  first.set_issue_analysis("off by one");
  first.add_test_commands("pytest tests/test_a.py");
  workspace::UpdateReport(&view, first);

  proto::WorkspaceReport second;
  second.set_next_steps("fix the loop bound");
  workspace::UpdateReport(&view, second);

  EXPECT_THAT(view.report().checklist(), ElementsAre("reproduce"));
  EXPECT_EQ(view.report().issue_analysis(), "off by one");
  EXPECT_EQ(view.report().next_steps(), "fix the loop bound");
  EXPECT_THAT(view.report().test_commands(),
              ElementsAre("pytest tests/test_a.py"));
}

// NOLINTNEXTLINE
TEST(WorkspaceViewTest, FormatReportSkipsEmptySections) {
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "src/a.py");
  workspace::OpenDirectory(&view, "src", 2);
  view.mutable_report()->set_issue_analysis("bad sign");
  std::string text = workspace::FormatReport(view);
  EXPECT_THAT(text, HasSubstr("<open_folders>\n- src (depth 2)\n"));
  EXPECT_THAT(text, HasSubstr("<open_files_in_code_editor>\n- src/a.py\n"));
  EXPECT_THAT(text, HasSubstr("<issue_analysis>\nbad sign\n</issue_analysis>"));
  EXPECT_THAT(text, Not(HasSubstr("<next_steps>")));
}

// NOLINTNEXTLINE
TEST(WorkspaceViewTest, SaveAndLoad) {
  util::TempDir dir(tests::kTestTmpDir);
  proto::WorkspaceView view;
  workspace::OpenFile(&view, "a.py");
  proto::CommandResult result;
  result.set_stdout("ok");
  workspace::RecordCommand(&view, "echo ok", result);
  std::string path = util::File::JoinPath(dir.Path(), "workspace.json");
  ASSERT_TRUE(workspace::SaveView(view, path).ok());

  proto::WorkspaceView loaded;
  ASSERT_TRUE(workspace::LoadView(path, &loaded).ok());
  EXPECT_THAT(loaded.open_files(), ElementsAre("a.py"));
  ASSERT_EQ(loaded.terminal_session_size(), 1);
  EXPECT_EQ(loaded.terminal_session(0).result().stdout(), "ok");
}

}  // namespace
