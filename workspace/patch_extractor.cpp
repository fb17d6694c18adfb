#include "workspace/patch_extractor.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "util/misc.hpp"

namespace workspace {

absl::StatusOr<std::string> PatchExtractor::Extract() {
  std::string ref = util::ShellQuote(baseline_ref_);
  // A private copy of the index receives every working tree change; the
  // copy keeps the stat cache, so only modified files are hashed again.
  std::string command = absl::StrCat(
      "git_dir=$(git rev-parse --absolute-git-dir) && tmp=$(mktemp -d) && "
      "trap 'rm -rf \"$tmp\"' EXIT && export GIT_INDEX_FILE=\"$tmp/index\" && "
      "{ cp \"$git_dir/index\" \"$GIT_INDEX_FILE\" 2>/dev/null || "
      "git read-tree ",
      ref,
      "; } && cd \"$(git rev-parse --show-toplevel)\" && git add -A . && "
      "git -c core.pager=cat diff --cached --no-color --no-ext-diff "
      "--binary ",
      ref);
  absl::StatusOr<proto::CommandResult> result = executor_->ExecuteRaw(command);
  if (!result.ok()) return result.status();
  absl::Status status = executor::CheckSucceeded(*result, "git diff");
  if (!status.ok()) return status;
  std::string patch = NormalizePatch(result->stdout());
  VLOG(1) << "Extracted " << patch.size() << " bytes of diff from "
          << executor_->instance().name;
  return patch;
}

namespace {
// Offset of the first line starting with header, or npos.
size_t FindLine(const std::string& text, const std::string& header) {
  if (text.compare(0, header.size(), header) == 0) return 0;
  size_t pos = text.find("\n" + header);
  return pos == std::string::npos ? pos : pos + 1;
}
}  // namespace

std::string NormalizePatch(const std::string& raw) {
  std::string patch = absl::StrReplaceAll(raw, {{"\r\n", "\n"}});
  size_t start = FindLine(patch, "diff --git ");
  if (start == std::string::npos) start = FindLine(patch, "--- ");
  if (start == std::string::npos) {
    if (absl::StripAsciiWhitespace(patch).empty()) return "";
    start = 0;
  }
  patch.erase(0, start);
  // Binary hunks end with a blank line that git apply requires.
  if (patch.back() != '\n') patch += '\n';
  return patch;
}

}  // namespace workspace
