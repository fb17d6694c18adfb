#include "process/run.hpp"

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "process/runner.hpp"
#include "util/file.hpp"
#include "util/status.hpp"
#include "util/which.hpp"

namespace process {

absl::StatusOr<proto::CommandResult> RunCommand(
    const std::vector<std::string>& argv, const RunOptions& options) {
  if (argv.empty()) return util::InvalidInput("Empty command line");
  std::string executable = util::which(argv[0]);
  if (executable.empty()) {
    return util::ProvisioningError("Cannot find " + argv[0] + " in PATH");
  }

  std::unique_ptr<util::TempDir> tmp;
  try {
    tmp.reset(new util::TempDir(options.temp_directory));
  } catch (const std::system_error& exc) {
    return util::ProvisioningError(exc.what());
  }
  ExecutionOptions exec_options(options.root, executable);
  exec_options.args.assign(argv.begin() + 1, argv.end());
  exec_options.wall_limit_millis = options.timeout_millis;
  exec_options.stdout_file = util::File::JoinPath(tmp->Path(), "stdout");
  exec_options.stderr_file = util::File::JoinPath(tmp->Path(), "stderr");
  if (!options.stdin_content.empty()) {
    exec_options.stdin_file = util::File::JoinPath(tmp->Path(), "stdin");
    try {
      util::File::Write(exec_options.stdin_file, options.stdin_content);
    } catch (const std::system_error& exc) {
      return util::ProvisioningError(exc.what());
    }
  }

  VLOG(1) << "Running " << absl::StrJoin(argv, " ");
  std::unique_ptr<Runner> runner = Runner::Create();
  if (!runner) return util::ProvisioningError("No process runner available");
  ExecutionInfo info;
  std::string error_msg;
  if (!runner->Execute(exec_options, &info, &error_msg)) {
    return util::ProvisioningError("Cannot run " + argv[0] + ": " + error_msg);
  }

  proto::CommandResult result;
  try {
    result.set_stdout(util::File::Read(exec_options.stdout_file));
    result.set_stderr(util::File::Read(exec_options.stderr_file));
  } catch (const std::system_error& exc) {
    return util::ProvisioningError(exc.what());
  }
  result.set_exit_code(info.signal ? 128 + info.signal : info.status_code);
  result.set_timed_out(info.timed_out);
  result.set_wall_time_millis(info.wall_time_millis);
  return result;
}

}  // namespace process
