#ifndef WORKSPACE_SNAPSHOT_HPP
#define WORKSPACE_SNAPSHOT_HPP

#include <string>

#include "absl/status/statusor.h"
#include "executor/command_executor.hpp"
#include "proto/workspace.pb.h"
#include "workspace/file_store.hpp"
#include "workspace/patch_extractor.hpp"

namespace workspace {

struct SnapshotOptions {
  // Characters of a file, or of the diff, rendered before truncation.
  size_t char_ceiling = 80000;
};

// Cuts text at ceiling characters and appends a marker with the amount
// omitted.
std::string Truncate(const std::string& text, size_t ceiling);

// Renders the workspace view of one instance as text for the model.
class WorkspaceSnapshot {
 public:
  WorkspaceSnapshot(executor::CommandExecutor* executor,
                    FileMutationStore* store, PatchExtractor* extractor,
                    SnapshotOptions options = SnapshotOptions())
      : executor_(executor),
        store_(store),
        extractor_(extractor),
        options_(options) {}

  // Open folders, then open files (least recently opened first), then the
  // cumulative diff and the terminal session. The terminal session of view
  // is cleared only when rendering succeeds.
  absl::StatusOr<std::string> Render(proto::WorkspaceView* view);

 private:
  absl::StatusOr<std::string> RenderFolder(const std::string& path,
                                           int32_t depth);
  absl::StatusOr<std::string> RenderFile(const std::string& path);

  executor::CommandExecutor* executor_;
  FileMutationStore* store_;
  PatchExtractor* extractor_;
  SnapshotOptions options_;
};

}  // namespace workspace

#endif
