#include "workspace/file_store.hpp"

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/status.hpp"

namespace workspace {

namespace {
// Exit codes of the read command.
const constexpr int kMissingExitCode = 3;
const constexpr int kDirectoryExitCode = 4;

absl::Status CheckPath(const std::string& path) {
  if (path.empty()) return util::InvalidInput("The path must not be empty");
  return absl::OkStatus();
}
}  // namespace

constexpr size_t FileMutationStore::kDefaultChunkBytes;

absl::Status FileMutationStore::Run(const std::string& command,
                                    const std::string& what) {
  absl::StatusOr<proto::CommandResult> result = executor_->ExecuteRaw(command);
  if (!result.ok()) return result.status();
  return executor::CheckSucceeded(*result, what);
}

absl::StatusOr<absl::optional<std::string>> FileMutationStore::ReadIfExists(
    const std::string& path) {
  std::string quoted = util::ShellQuote(path);
  absl::StatusOr<proto::CommandResult> result = executor_->ExecuteRaw(
      absl::StrCat("if [ -d ", quoted, " ]; then exit ", kDirectoryExitCode,
                   "; elif [ -f ", quoted, " ]; then cat -- ", quoted,
                   "; else exit ", kMissingExitCode, "; fi"));
  if (!result.ok()) return result.status();
  if (!result->timed_out() && result->exit_code() == kMissingExitCode) {
    return absl::optional<std::string>();
  }
  if (!result->timed_out() && result->exit_code() == kDirectoryExitCode) {
    return util::FileMutationConflict(path + " is a directory");
  }
  absl::Status status = executor::CheckSucceeded(*result, "read " + path);
  if (!status.ok()) return status;
  return absl::optional<std::string>(result->stdout());
}

absl::Status FileMutationStore::Write(const std::string& path,
                                      const std::string& content) {
  std::string quoted = util::ShellQuote(path);
  std::string encoded = absl::Base64Escape(content);
  std::string mkdir = absl::StrCat("mkdir -p \"$(dirname -- ", quoted, ")\"");
  if (encoded.size() <= chunk_bytes_) {
    return Run(absl::StrCat(mkdir, " && printf '%s' '", encoded,
                            "' | base64 -d > ", quoted),
               "write " + path);
  }

  // Large contents are staged in the scratch directory, one chunk per
  // command, to stay below the command line length limit.
  std::string staging = util::ShellQuote(util::File::JoinPath(
      executor_->instance().scratch_dir,
      absl::StrCat("fixbench-write-", write_counter_++, ".b64")));
  absl::Status status = Run(absl::StrCat(": > ", staging), "stage " + path);
  for (size_t pos = 0; status.ok() && pos < encoded.size();
       pos += chunk_bytes_) {
    status = Run(absl::StrCat("printf '%s' '", encoded.substr(pos, chunk_bytes_),
                              "' >> ", staging),
                 "stage " + path);
  }
  if (status.ok()) {
    status = Run(absl::StrCat(mkdir, " && base64 -d ", staging, " > ", quoted),
                 "write " + path);
  }
  absl::Status cleanup = Run("rm -f " + staging, "remove " + staging);
  if (!cleanup.ok()) LOG(WARNING) << cleanup.message();
  return status;
}

absl::Status FileMutationStore::Delete(const std::string& path) {
  return Run("rm -f -- " + util::ShellQuote(path), "remove " + path);
}

absl::Status FileMutationStore::Mutate(const std::string& path,
                                       absl::optional<std::string> previous,
                                       const std::string& content) {
  absl::Status status = Write(path, content);
  if (!status.ok()) return status;
  history_[path].push_back(FileEditRecord{path, std::move(previous)});
  VLOG(1) << "Edited " << path << ", history depth "
          << history_[path].size();
  return absl::OkStatus();
}

absl::Status FileMutationStore::Create(const std::string& path,
                                       const std::string& content,
                                       bool overwrite) {
  absl::Status valid = CheckPath(path);
  if (!valid.ok()) return valid;
  absl::MutexLock lck(&mutex_);
  auto previous = ReadIfExists(path);
  if (!previous.ok()) return previous.status();
  if (previous->has_value() && !overwrite) {
    return util::FileMutationConflict(
        "File " + path +
        " already exists. Use str_replace or insert to modify it, or set "
        "overwrite to replace its whole content.");
  }
  return Mutate(path, std::move(*previous), content);
}

absl::Status FileMutationStore::Replace(const std::string& path,
                                        const std::string& old_text,
                                        const std::string& new_text) {
  absl::Status valid = CheckPath(path);
  if (!valid.ok()) return valid;
  if (old_text.empty()) return util::InvalidInput("old_str must not be empty");
  absl::MutexLock lck(&mutex_);
  auto current = ReadIfExists(path);
  if (!current.ok()) return current.status();
  if (!current->has_value()) {
    return util::FileMutationConflict("File " + path + " does not exist");
  }
  const std::string& content = **current;

  std::vector<int64_t> lines;
  size_t first = content.find(old_text);
  for (size_t pos = first; pos != std::string::npos;
       pos = content.find(old_text, pos + old_text.size())) {
    lines.push_back(util::LineAt(content, pos));
  }
  if (lines.empty()) {
    return util::FileMutationConflict("No occurrence of old_str found in " +
                                      path + "; the file was not changed.");
  }
  if (lines.size() > 1) {
    return util::FileMutationConflict(absl::StrCat(
        "old_str occurs ", lines.size(), " times in ", path, " (lines ",
        absl::StrJoin(lines, ", "),
        "); include more context to make it unique. The file was not "
        "changed."));
  }
  std::string updated = content;
  updated.replace(first, old_text.size(), new_text);
  return Mutate(path, std::move(*current), updated);
}

absl::Status FileMutationStore::Insert(const std::string& path, int64_t line,
                                       const std::string& text) {
  absl::Status valid = CheckPath(path);
  if (!valid.ok()) return valid;
  absl::MutexLock lck(&mutex_);
  auto current = ReadIfExists(path);
  if (!current.ok()) return current.status();
  if (!current->has_value()) {
    return util::FileMutationConflict("File " + path + " does not exist");
  }
  const std::string& content = **current;
  std::vector<std::string> lines = util::SplitLines(content);
  int64_t line_count = lines.size();
  if (line < 1 || line > line_count + 1) {
    return util::FileMutationConflict(absl::StrCat(
        "insert_line ", line, " is out of range [1, ", line_count + 1,
        "] for ", path, "; the file was not changed."));
  }
  std::vector<std::string> inserted = util::SplitLines(text);
  if (inserted.empty()) inserted.emplace_back();
  lines.insert(lines.begin() + (line - 1), inserted.begin(), inserted.end());
  bool trailing_newline = content.empty() || content.back() == '\n';
  std::string updated = absl::StrJoin(lines, "\n");
  if (trailing_newline) updated += '\n';
  return Mutate(path, std::move(*current), updated);
}

absl::Status FileMutationStore::Undo(const std::string& path) {
  absl::MutexLock lck(&mutex_);
  auto it = history_.find(path);
  if (it == history_.end() || it->second.empty()) {
    return util::FileMutationConflict("No edit history for " + path);
  }
  const FileEditRecord& record = it->second.back();
  absl::Status status = record.previous_content
                            ? Write(path, *record.previous_content)
                            : Delete(path);
  if (!status.ok()) return status;
  it->second.pop_back();
  return absl::OkStatus();
}

absl::Status FileMutationStore::Reset(const std::string& path) {
  absl::Status valid = CheckPath(path);
  if (!valid.ok()) return valid;
  absl::MutexLock lck(&mutex_);
  std::string quoted = util::ShellQuote(path);
  std::string ref = util::ShellQuote(baseline_ref_);
  absl::Status status = Run(
      absl::StrCat("if git ls-tree --name-only ", ref, " -- ", quoted,
                   " | grep -q .; then git checkout ", ref, " -- ", quoted,
                   "; else rm -f -- ", quoted, "; fi"),
      "reset " + path);
  if (!status.ok()) return status;
  history_.erase(path);
  return absl::OkStatus();
}

absl::StatusOr<std::string> FileMutationStore::Read(const std::string& path) {
  absl::Status valid = CheckPath(path);
  if (!valid.ok()) return valid;
  absl::ReaderMutexLock lck(&mutex_);
  auto content = ReadIfExists(path);
  if (!content.ok()) return content.status();
  if (!content->has_value()) {
    return util::FileMutationConflict("File " + path + " does not exist");
  }
  return std::move(**content);
}

size_t FileMutationStore::HistoryDepth(const std::string& path) const {
  absl::MutexLock lck(&mutex_);
  auto it = history_.find(path);
  return it == history_.end() ? 0 : it->second.size();
}

}  // namespace workspace
