#include "workspace/snapshot.hpp"

#include <map>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/misc.hpp"
#include "util/status.hpp"

namespace workspace {

namespace {
const char* const kNoisePatterns[] = {
    ".*",   "__pycache__", "*.pyc", "*.egg-info", "node_modules",
    "build", "dist",       "*.o",
};

bool IsProvisioning(const absl::Status& status) {
  return util::GetErrorKind(status) == util::ErrorKind::kProvisioning;
}
}  // namespace

std::string Truncate(const std::string& text, size_t ceiling) {
  if (text.size() <= ceiling) return text;
  size_t cut = util::Utf8Boundary(text, ceiling);
  std::string out = text.substr(0, cut);
  if (!out.empty() && out.back() != '\n') out += '\n';
  absl::StrAppend(&out, "<<< TRUNCATED: ", text.size() - cut, " of ",
                  text.size(), " characters omitted >>>\n");
  return out;
}

absl::StatusOr<std::string> WorkspaceSnapshot::RenderFolder(
    const std::string& path, int32_t depth) {
  std::vector<std::string> names;
  for (const char* pattern : kNoisePatterns) {
    names.push_back(absl::StrCat("-name ", util::ShellQuote(pattern)));
  }
  std::string command = absl::StrCat(
      "find ", util::ShellQuote(path), " -mindepth 1 -maxdepth ", depth,
      " \\( ", absl::StrJoin(names, " -o "), " \\) -prune -o -print | sort");
  absl::StatusOr<proto::CommandResult> result = executor_->ExecuteRaw(command);
  if (!result.ok()) return result.status();
  if (!result->stderr().empty() && result->stdout().empty()) {
    return absl::StrCat("Cannot list ", path, ": ", result->stderr());
  }
  if (result->stdout().empty()) return std::string("(empty)\n");
  return result->stdout();
}

absl::StatusOr<std::string> WorkspaceSnapshot::RenderFile(
    const std::string& path) {
  absl::StatusOr<std::string> content = store_->Read(path);
  if (!content.ok()) {
    if (IsProvisioning(content.status())) return content.status();
    return absl::StrCat("Cannot show ", path, ": ", content.status().message(),
                        "\n");
  }
  if (content->empty()) return std::string("(empty file)\n");
  size_t cut = util::Utf8Boundary(*content, options_.char_ceiling);
  std::string text = util::NumberLines(content->substr(0, cut));
  if (cut < content->size()) {
    absl::StrAppend(&text, "<<< TRUNCATED: ", content->size() - cut, " of ",
                    content->size(), " characters omitted >>>\n");
  }
  return text;
}

absl::StatusOr<std::string> WorkspaceSnapshot::Render(
    proto::WorkspaceView* view) {
  std::string out;
  std::map<std::string, int32_t> folders(view->open_directories().begin(),
                                         view->open_directories().end());
  for (const auto& folder : folders) {
    absl::StatusOr<std::string> listing =
        RenderFolder(folder.first, folder.second);
    if (!listing.ok()) return listing.status();
    absl::StrAppend(&out, "## Folder ", folder.first, " (depth ",
                    folder.second, ")\n", *listing, "\n");
  }

  for (int i = view->open_files_size() - 1; i >= 0; i--) {
    const std::string& path = view->open_files(i);
    absl::StatusOr<std::string> file = RenderFile(path);
    if (!file.ok()) return file.status();
    absl::StrAppend(&out, "## File ", path, "\n", *file, "\n");
  }

  absl::StatusOr<std::string> patch = extractor_->Extract();
  if (!patch.ok()) {
    if (IsProvisioning(patch.status())) return patch.status();
    absl::StrAppend(&out, "## Changes\nCannot compute the diff: ",
                    patch.status().message(), "\n\n");
  } else if (patch->empty()) {
    absl::StrAppend(&out, "## Changes\nNo changes yet.\n\n");
  } else {
    absl::StrAppend(&out, "## Changes\n",
                    Truncate(*patch, options_.char_ceiling), "\n");
  }

  if (view->terminal_session_size() > 0) {
    absl::StrAppend(&out, "## Terminal\n");
    for (const proto::TerminalEntry& entry : view->terminal_session()) {
      const proto::CommandResult& result = entry.result();
      absl::StrAppend(&out, "$ ", entry.command(), "\n", result.stdout());
      if (!result.stdout().empty() && result.stdout().back() != '\n') {
        out += '\n';
      }
      if (!result.stderr().empty()) {
        absl::StrAppend(&out, "[stderr]\n", result.stderr());
        if (result.stderr().back() != '\n') out += '\n';
      }
      absl::StrAppend(&out, "[exit code: ", result.exit_code(),
                      result.timed_out() ? ", timed out" : "", "]\n\n");
    }
  }
  view->clear_terminal_session();
  VLOG(1) << "Rendered snapshot of " << out.size() << " characters";
  // File contents and listings are raw bytes of the instance.
  return util::SanitizeUtf8(out);
}

}  // namespace workspace
