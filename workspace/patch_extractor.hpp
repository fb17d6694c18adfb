#ifndef WORKSPACE_PATCH_EXTRACTOR_HPP
#define WORKSPACE_PATCH_EXTRACTOR_HPP

#include <string>

#include "absl/status/statusor.h"
#include "executor/command_executor.hpp"

namespace workspace {

// Computes the cumulative change of an instance against its baseline,
// untracked files included. Neither the index nor the working tree of the
// repository are touched, so extracting twice gives the same text.
class PatchExtractor {
 public:
  PatchExtractor(executor::CommandExecutor* executor, std::string baseline_ref)
      : executor_(executor), baseline_ref_(std::move(baseline_ref)) {}

  // The normalized unified diff; empty when nothing changed.
  absl::StatusOr<std::string> Extract();

 private:
  executor::CommandExecutor* executor_;
  std::string baseline_ref_;
};

// Converts CRLF to LF, drops anything before the first file header and
// appends a newline when the patch lacks one. Trailing blank lines are kept.
// Blank input gives "".
std::string NormalizePatch(const std::string& raw);

}  // namespace workspace

#endif
