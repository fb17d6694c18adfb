#ifndef AGENT_AGENT_LOOP_HPP
#define AGENT_AGENT_LOOP_HPP

#include <atomic>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "agent/conversation.hpp"
#include "agent/model.hpp"
#include "agent/tools.hpp"
#include "executor/command_executor.hpp"
#include "proto/report.pb.h"
#include "proto/workspace.pb.h"
#include "workspace/file_store.hpp"
#include "workspace/patch_extractor.hpp"
#include "workspace/snapshot.hpp"

namespace agent {

extern const char* const kDefaultSystemPrompt;

struct AgentOptions {
  int32_t max_iterations = 30;
  // Steps between two context resets; 0 never resets.
  int32_t reset_interval = 8;
  // Runs batches made only of read-only tools concurrently.
  bool parallel_read_only = true;
  // Extensions, without the dot, counted to find the main source folder.
  std::vector<std::string> source_extensions = {"py"};
  std::string system_prompt = kDefaultSystemPrompt;
  proto::CompletionOptions completion;
  // Persistence targets; empty paths are not written.
  std::string history_path;
  std::string view_path;
  workspace::SnapshotOptions snapshot;
};

// Drives the model on one instance until it submits, runs out of steps or
// is cancelled.
class AgentLoop {
 public:
  enum class State { kInit, kRunning, kResetting, kTerminated };

  AgentLoop(ModelProvider* model, executor::CommandExecutor* executor,
            workspace::FileMutationStore* store,
            workspace::PatchExtractor* extractor, AgentOptions options,
            const std::atomic<bool>* cancelled = nullptr);

  // Returns the final iteration state, or the error that aborted the loop:
  // a ProvisioningError or a model error that retries did not fix.
  absl::StatusOr<proto::IterationState> Run(
      const std::string& problem_statement);

  State state() const { return state_; }
  const proto::IterationState& iteration() const { return iteration_; }
  const proto::WorkspaceView& view() const { return view_; }
  const ConversationLog& conversation() const { return conversation_; }

  AgentLoop(const AgentLoop&) = delete;
  AgentLoop& operator=(const AgentLoop&) = delete;

 private:
  absl::Status Init();
  // One model turn and its tool batch. Sets terminate when submit ran.
  absl::Status Step(bool* terminate);
  absl::Status ResetContext();
  absl::StatusOr<std::vector<ToolOutcome>> DispatchBatch(
      const proto::Message& message);
  // Top level folder holding the most source files, or "".
  absl::StatusOr<std::string> DetectSourceFolder();
  void SeedConversation();
  void Checkpoint();
  bool Cancelled() const { return cancelled_ != nullptr && *cancelled_; }

  ModelProvider* model_;
  executor::CommandExecutor* executor_;
  AgentOptions options_;
  const std::atomic<bool>* cancelled_;

  proto::WorkspaceView view_;
  workspace::WorkspaceSnapshot snapshot_;
  ToolDispatcher dispatcher_;
  ConversationLog conversation_;
  std::vector<proto::ToolDescriptor> tools_;
  std::string problem_statement_;
  proto::IterationState iteration_;
  State state_ = State::kInit;
};

}  // namespace agent

#endif
