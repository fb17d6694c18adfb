#include "executor/command_executor.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/misc.hpp"
#include "util/status.hpp"

namespace executor {

const char* const kEmptyOutputSentinel =
    "Command executed successfully but produced no output.";

std::string CommandExecutor::Wrap(const std::string& command) const {
  std::string wrapped;
  if (!options_.preamble.empty()) {
    absl::StrAppend(&wrapped, options_.preamble, " && ");
  }
  absl::StrAppend(&wrapped, "cd ", util::ShellQuote(options_.workdir),
                  " && {\n", command, "\n}");
  return wrapped;
}

absl::StatusOr<proto::CommandResult> CommandExecutor::ExecuteRaw(
    const std::string& command, int64_t timeout_millis) {
  if (timeout_millis <= 0) timeout_millis = options_.default_timeout_millis;
  VLOG(1) << instance_->name << "$ " << command;
  absl::StatusOr<proto::CommandResult> result =
      provider_->Exec(*instance_, Wrap(command), timeout_millis);
  if (!result.ok()) {
    LOG(WARNING) << "Cannot run command in " << instance_->name << ": "
                 << result.status().message();
    return result.status();
  }
  if (result->timed_out()) {
    LOG(WARNING) << "Command timed out after " << timeout_millis
                 << "ms in " << instance_->name << ": " << command;
    result->set_exit_code(kTimeoutExitCode);
  }
  return result;
}

absl::StatusOr<proto::CommandResult> CommandExecutor::Execute(
    const std::string& command, int64_t timeout_millis) {
  absl::StatusOr<proto::CommandResult> result =
      ExecuteRaw(command, timeout_millis);
  if (!result.ok()) return result;
  result->set_stdout(util::SanitizeUtf8(result->stdout()));
  result->set_stderr(util::SanitizeUtf8(result->stderr()));
  if (result->exit_code() == 0 && !result->timed_out() &&
      result->stdout().empty() && result->stderr().empty()) {
    result->set_stdout(kEmptyOutputSentinel);
  }
  return result;
}

absl::Status CheckSucceeded(const proto::CommandResult& result,
                            const std::string& what) {
  if (result.timed_out()) {
    return util::MakeError(util::ErrorKind::kCommandTimeout,
                           absl::StrCat(what, ": timed out after ",
                                        result.wall_time_millis(), "ms"));
  }
  if (result.exit_code() != 0) {
    return util::MakeError(
        util::ErrorKind::kCommandFailure,
        absl::StrCat(what, ": exit code ", result.exit_code(), ": ",
                     result.stderr()));
  }
  return absl::OkStatus();
}

std::string FormatResult(const proto::CommandResult& result) {
  std::string text;
  if (result.timed_out()) {
    absl::StrAppend(&text, "Command timed out after ",
                    result.wall_time_millis() / 1000.0, " seconds.\n");
  }
  absl::StrAppend(&text, result.stdout());
  if (!result.stderr().empty()) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    absl::StrAppend(&text, "[stderr]\n", result.stderr());
  }
  if (result.exit_code() != 0) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    absl::StrAppend(&text, "[exit code: ", result.exit_code(), "]");
  }
  return text;
}

}  // namespace executor
