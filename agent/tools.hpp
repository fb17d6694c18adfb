#ifndef AGENT_TOOLS_HPP
#define AGENT_TOOLS_HPP

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "executor/command_executor.hpp"
#include "proto/conversation.pb.h"
#include "proto/workspace.pb.h"
#include "workspace/file_store.hpp"

namespace agent {

enum class ToolKind {
  kBash,
  kEditFile,
  kViewFile,
  kOpenFile,
  kCloseFile,
  kOpenFolder,
  kCloseFolder,
  kReport,
  kSubmit,
};

struct ToolSpec {
  ToolKind kind;
  const char* name;
  const char* description;
  // JSON schema of the arguments object.
  const char* parameters_json;
  // Neither the instance nor the workspace view is modified.
  bool read_only;
  // Ends the agent loop once its batch has run.
  bool terminates;
};

// Every tool the agent knows. The set is fixed at compile time.
const std::vector<ToolSpec>& ToolSpecs();

// nullptr when there is no tool with that name.
const ToolSpec* FindTool(const std::string& name);

std::vector<proto::ToolDescriptor> ToolDescriptors();

struct ToolOutcome {
  std::string content;
  bool success = true;
  bool terminate = false;
};

struct DispatcherOptions {
  // Characters of a file shown by view_file before truncation.
  size_t view_char_ceiling = 80000;
};

// Runs tool invocations against one instance and its workspace view.
// Failures of the tool itself are reported in the outcome; only errors that
// make the instance unusable are returned as a status.
class ToolDispatcher {
 public:
  ToolDispatcher(executor::CommandExecutor* executor,
                 workspace::FileMutationStore* store,
                 proto::WorkspaceView* view,
                 DispatcherOptions options = DispatcherOptions())
      : executor_(executor), store_(store), view_(view), options_(options) {}

  // Read-only tools may be dispatched from several threads at once.
  absl::StatusOr<ToolOutcome> Dispatch(const proto::ToolInvocation& invocation);

 private:
  absl::StatusOr<ToolOutcome> Invoke(ToolKind kind,
                                     const std::string& arguments);
  absl::StatusOr<ToolOutcome> Bash(const std::string& arguments);
  absl::StatusOr<ToolOutcome> EditFile(const std::string& arguments);
  absl::StatusOr<ToolOutcome> ViewFile(const std::string& arguments);
  absl::StatusOr<ToolOutcome> OpenFiles(const std::string& arguments);
  absl::StatusOr<ToolOutcome> CloseFiles(const std::string& arguments);
  absl::StatusOr<ToolOutcome> OpenFolder(const std::string& arguments);
  absl::StatusOr<ToolOutcome> CloseFolder(const std::string& arguments);
  absl::StatusOr<ToolOutcome> Report(const std::string& arguments);
  absl::StatusOr<ToolOutcome> Submit(const std::string& arguments);

  executor::CommandExecutor* executor_;
  workspace::FileMutationStore* store_;
  proto::WorkspaceView* view_;
  DispatcherOptions options_;
};

}  // namespace agent

#endif
