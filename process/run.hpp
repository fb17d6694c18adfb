#ifndef PROCESS_RUN_HPP
#define PROCESS_RUN_HPP

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "proto/command.pb.h"

namespace process {

struct RunOptions {
  // Working directory of the program.
  std::string root = "/";
  // 0 means no limit.
  int64_t timeout_millis = 0;
  std::string stdin_content;
  // Where the captured stdin/stdout/stderr files live during the run.
  std::string temp_directory = "/tmp";
};

// Runs argv on the host and captures its output. argv[0] is looked up in PATH
// when it is not a path. Returns a ProvisioningError only when the program
// could not be started; a nonzero exit or a timeout is reported in the result.
absl::StatusOr<proto::CommandResult> RunCommand(
    const std::vector<std::string>& argv, const RunOptions& options);

}  // namespace process

#endif
