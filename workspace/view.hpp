#ifndef WORKSPACE_VIEW_HPP
#define WORKSPACE_VIEW_HPP

#include <string>

#include "absl/status/status.h"
#include "proto/workspace.pb.h"

namespace workspace {

// Moves path to the front of the open files.
void OpenFile(proto::WorkspaceView* view, const std::string& path);
// Returns false if path was not open.
bool CloseFile(proto::WorkspaceView* view, const std::string& path);

void OpenDirectory(proto::WorkspaceView* view, const std::string& path,
                   int32_t depth);
bool CloseDirectory(proto::WorkspaceView* view, const std::string& path);

void RecordCommand(proto::WorkspaceView* view, const std::string& command,
                   const proto::CommandResult& result);

// Fields set in update replace the ones of the view's report.
void UpdateReport(proto::WorkspaceView* view,
                  const proto::WorkspaceReport& update);

// Compact text of the report and of the open files and folders, used to
// restart a conversation after a context reset.
std::string FormatReport(const proto::WorkspaceView& view);

absl::Status SaveView(const proto::WorkspaceView& view,
                      const std::string& path);
absl::Status LoadView(const std::string& path, proto::WorkspaceView* view);

}  // namespace workspace

#endif
