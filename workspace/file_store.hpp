#ifndef WORKSPACE_FILE_STORE_HPP
#define WORKSPACE_FILE_STORE_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "executor/command_executor.hpp"

namespace workspace {

// Content of a path before one mutation. An empty previous_content means the
// file did not exist.
struct FileEditRecord {
  std::string path;
  absl::optional<std::string> previous_content;
};

// Edits files inside an instance and keeps a per-path undo history. The
// current content is always read back from the instance, never cached.
// Failed operations leave both the file and the history untouched.
class FileMutationStore {
 public:
  static const constexpr size_t kDefaultChunkBytes = 64 * 1024;

  // baseline_ref is the git revision Reset restores from.
  FileMutationStore(executor::CommandExecutor* executor,
                    std::string baseline_ref,
                    size_t chunk_bytes = kDefaultChunkBytes)
      : executor_(executor),
        baseline_ref_(std::move(baseline_ref)),
        chunk_bytes_(chunk_bytes) {}

  // Creates path with content. Fails if the file exists, unless overwrite.
  absl::Status Create(const std::string& path, const std::string& content,
                      bool overwrite = false);

  // Replaces the only occurrence of old_text with new_text.
  absl::Status Replace(const std::string& path, const std::string& old_text,
                       const std::string& new_text);

  // Inserts text so that it starts at the given 1-based line.
  absl::Status Insert(const std::string& path, int64_t line,
                      const std::string& text);

  // Reverts the last mutation of path.
  absl::Status Undo(const std::string& path);

  // Restores the baseline version of path and forgets its history.
  absl::Status Reset(const std::string& path);

  // Current content of path. Reads may run concurrently with each other.
  absl::StatusOr<std::string> Read(const std::string& path);

  size_t HistoryDepth(const std::string& path) const;

  FileMutationStore(const FileMutationStore&) = delete;
  FileMutationStore& operator=(const FileMutationStore&) = delete;

 private:
  absl::StatusOr<absl::optional<std::string>> ReadIfExists(
      const std::string& path) SHARED_LOCKS_REQUIRED(mutex_);
  absl::Status Write(const std::string& path, const std::string& content)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::Status Delete(const std::string& path)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Writes content and pushes previous onto the history of path.
  absl::Status Mutate(const std::string& path,
                      absl::optional<std::string> previous,
                      const std::string& content)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::Status Run(const std::string& command, const std::string& what)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  executor::CommandExecutor* executor_;
  std::string baseline_ref_;
  size_t chunk_bytes_;
  mutable absl::Mutex mutex_;
  int64_t write_counter_ GUARDED_BY(mutex_) = 0;
  std::map<std::string, std::vector<FileEditRecord>> history_
      GUARDED_BY(mutex_);
};

}  // namespace workspace

#endif
