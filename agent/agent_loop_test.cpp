#include "agent/agent_loop.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/instance.hpp"
#include "tests/git_repo.hpp"
#include "util/json.hpp"
#include "util/status.hpp"

namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;

class MockModel : public agent::ModelProvider {
 public:
  MOCK_METHOD3(Complete, absl::StatusOr<proto::Message>(
                             const std::vector<proto::Message>&,
                             const std::vector<proto::ToolDescriptor>&,
                             const proto::CompletionOptions&));
};

proto::Message Calls(
    const std::vector<std::pair<std::string, std::string>>& calls) {
  proto::Message message;
  message.set_role(proto::ASSISTANT);
  int id = 0;
  for (const auto& call : calls) {
    proto::ToolInvocation* invocation = message.add_tool_invocations();
    invocation->set_id("call-" + std::to_string(id++));
    invocation->set_name(call.first);
    invocation->set_arguments_json(call.second);
  }
  return message;
}

class AgentLoopTest : public ::testing::Test {
 protected:
  AgentLoopTest()
      : repo_({{"pkg/core.py", "def f():\n    return 1\n"},
               {"pkg/extra.py", "X = 1\n"},
               {"tests/test_a.py", "\n"},
               {"tests/test_b.py", "\n"},
               {"tests/test_c.py", "\n"},
               {"setup.py", "\n"}}),
        output_(tests::kTestTmpDir) {
    sandbox::ProviderOptions options;
    options.temp_directory = tests::kTestTmpDir;
    provider_ = sandbox::IsolationProvider::Create("local", options);
    options_.history_path =
        util::File::JoinPath(output_.Path(), "history.jsonl");
    options_.view_path = util::File::JoinPath(output_.Path(), "workspace.json");
    options_.reset_interval = 0;
  }

  void SetUp() override {
    sandbox::StartOptions options;
    options.image = repo_.Path();
    options.name = "agent-loop-test";
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

  std::unique_ptr<agent::AgentLoop> Loop(
      const std::atomic<bool>* cancelled = nullptr) {
    return std::unique_ptr<agent::AgentLoop>(
        new agent::AgentLoop(&model_, executor_.get(), store_.get(),
                             extractor_.get(), options_, cancelled));
  }

  std::vector<proto::Message> History() {
    auto messages =
        util::ReadJsonLines<proto::Message>(options_.history_path);
    EXPECT_TRUE(messages.ok()) << messages.status();
    return messages.ok() ? *messages : std::vector<proto::Message>();
  }

  tests::GitRepo repo_;
  util::TempDir output_;
  MockModel model_;
  agent::AgentOptions options_;
  std::unique_ptr<sandbox::IsolationProvider> provider_;
  std::unique_ptr<sandbox::ScopedInstance> instance_;
  std::unique_ptr<executor::CommandExecutor> executor_;
  std::unique_ptr<workspace::FileMutationStore> store_;
  std::unique_ptr<workspace::PatchExtractor> extractor_;
};

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, StopsAtMaxIterations) {
  options_.max_iterations = 3;
  EXPECT_CALL(model_, Complete(_, _, _))
      .Times(3)
      .WillRepeatedly(Return(Calls({{"bash", R"({"command": "echo hi"})"}})));
  auto loop = Loop();
  auto state = loop->Run("The answer is wrong.");
  ASSERT_TRUE(state.ok()) << state.status();
  EXPECT_EQ(state->iteration_count(), 3);
  EXPECT_EQ(state->termination_reason(), proto::MAX_ITERATIONS);
  EXPECT_EQ(loop->state(), agent::AgentLoop::State::kTerminated);
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, SubmitTerminatesAfterTheBatch) {
  EXPECT_CALL(model_, Complete(_, _, _))
      .WillOnce(Return(Calls(
          {{"submit", "{}"},
           {"edit_file",
            R"({"command": "str_replace", "path": "pkg/core.py", "old_str": "return 1", "new_str": "return 2"})"}})));
  auto loop = Loop();
  auto state = loop->Run("f should return 2");
  ASSERT_TRUE(state.ok()) << state.status();
  EXPECT_EQ(state->iteration_count(), 1);
  EXPECT_EQ(state->termination_reason(), proto::TOOL_TERMINATE);
  EXPECT_THAT(*store_->Read("pkg/core.py"), HasSubstr("return 2"));

  std::vector<proto::Message> history = History();
  ASSERT_GE(history.size(), 3u);
  EXPECT_EQ(history[0].role(), proto::SYSTEM);
  EXPECT_THAT(history[1].content(), HasSubstr("f should return 2"));
  EXPECT_EQ(history.back().role(), proto::TOOL);
  EXPECT_EQ(history.back().tool_name(), "edit_file");

  proto::WorkspaceView saved;
  ASSERT_TRUE(util::ReadJsonFile(options_.view_path, &saved).ok());
  EXPECT_EQ(saved.open_files(0), "pkg/core.py");
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, OpensTheMainSourceFolder) {
  options_.max_iterations = 1;
  std::string snapshot;
  EXPECT_CALL(model_, Complete(_, _, _))
      .WillOnce(Invoke([&snapshot](const std::vector<proto::Message>& messages,
                                   const std::vector<proto::ToolDescriptor>&,
                                   const proto::CompletionOptions&) {
        snapshot = messages.back().content();
        return absl::StatusOr<proto::Message>(Calls({}));
      }));
  auto loop = Loop();
  ASSERT_TRUE(loop->Run("issue").ok());
  EXPECT_EQ(loop->view().open_directories().at("pkg"), 2);
  EXPECT_EQ(loop->view().open_directories().count("tests"), 0u);
  EXPECT_THAT(snapshot, HasSubstr("pkg/extra.py"));
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, ResetRebuildsTheConversationFromTheReport) {
  options_.max_iterations = 5;
  options_.reset_interval = 2;
  std::vector<std::vector<proto::Message>> requests;
  int call = 0;
  EXPECT_CALL(model_, Complete(_, _, _))
      .Times(5)
      .WillRepeatedly(Invoke(
          [&](const std::vector<proto::Message>& messages,
              const std::vector<proto::ToolDescriptor>&,
              const proto::CompletionOptions&) {
            requests.push_back(messages);
            if (call++ == 0) {
              return absl::StatusOr<proto::Message>(Calls(
                  {{"report",
                    R"({"report": {"issue_analysis": "f is off by one", "test_commands": ["echo suite passed"]}})"}}));
            }
            return absl::StatusOr<proto::Message>(
                Calls({{"bash", R"({"command": "echo step"})"}}));
          }));
  auto loop = Loop();
  auto state = loop->Run("issue");
  ASSERT_TRUE(state.ok()) << state.status();
  EXPECT_EQ(state->iteration_count(), 5);
  EXPECT_EQ(state->reset_cycle_count(), 2);

  // The third request is the first one after a reset: system prompt, issue,
  // notes and snapshot only.
  ASSERT_EQ(requests.size(), 5u);
  ASSERT_EQ(requests[2].size(), 4u);
  EXPECT_THAT(requests[2][2].content(), HasSubstr("f is off by one"));
  EXPECT_THAT(requests[2][2].content(), HasSubstr("suite passed"));

  int resets = 0;
  for (const proto::Message& message : History()) {
    if (message.role() == proto::RESET) resets++;
  }
  EXPECT_EQ(resets, 2);
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, ReadOnlyBatchKeepsInvocationOrder) {
  options_.max_iterations = 1;
  EXPECT_CALL(model_, Complete(_, _, _))
      .WillOnce(Return(Calls({{"view_file", R"({"path": "pkg/core.py"})"},
                              {"view_file", R"({"path": "pkg/extra.py"})"},
                              {"view_file", R"({"path": "missing.py"})"}})));
  auto loop = Loop();
  ASSERT_TRUE(loop->Run("issue").ok());
  const auto& window = loop->conversation().window();
  ASSERT_GE(window.size(), 3u);
  const proto::Message& first = window[window.size() - 3];
  const proto::Message& second = window[window.size() - 2];
  const proto::Message& third = window[window.size() - 1];
  EXPECT_EQ(first.tool_invocation_id(), "call-0");
  EXPECT_THAT(first.content(), HasSubstr("return 1"));
  EXPECT_THAT(second.content(), HasSubstr("X = 1"));
  EXPECT_THAT(third.content(), HasSubstr("Error"));
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, FatalModelErrorAbortsTheLoop) {
  EXPECT_CALL(model_, Complete(_, _, _))
      .WillOnce(Return(
          util::MakeError(util::ErrorKind::kModelFatal, "invalid key")));
  auto loop = Loop();
  auto state = loop->Run("issue");
  EXPECT_EQ(util::GetErrorKind(state.status()), util::ErrorKind::kModelFatal);
  EXPECT_EQ(loop->state(), agent::AgentLoop::State::kTerminated);
}

// NOLINTNEXTLINE
TEST_F(AgentLoopTest, CancelledBeforeTheFirstStep) {
  std::atomic<bool> cancelled{true};
  EXPECT_CALL(model_, Complete(_, _, _)).Times(0);
  auto loop = Loop(&cancelled);
  auto state = loop->Run("issue");
  ASSERT_TRUE(state.ok()) << state.status();
  EXPECT_EQ(state->termination_reason(), proto::CANCELLED);
  EXPECT_EQ(state->iteration_count(), 0);
}

}  // namespace
