#include "agent/command_model.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "process/run.hpp"
#include "util/json.hpp"
#include "util/status.hpp"

namespace agent {

absl::StatusOr<proto::Message> CommandModelProvider::Complete(
    const std::vector<proto::Message>& messages,
    const std::vector<proto::ToolDescriptor>& tools,
    const proto::CompletionOptions& options) {
  if (options_.command.empty()) {
    return util::MakeError(util::ErrorKind::kModelFatal,
                           "No model command configured");
  }
  proto::ModelRequest request;
  for (const proto::Message& message : messages) {
    *request.add_messages() = message;
  }
  for (const proto::ToolDescriptor& tool : tools) *request.add_tools() = tool;
  *request.mutable_options() = options;
  absl::StatusOr<std::string> json = util::ToJson(request);
  if (!json.ok()) {
    return util::MakeError(util::ErrorKind::kModelFatal,
                           json.status().message());
  }

  process::RunOptions run_options;
  run_options.timeout_millis = options_.timeout_millis;
  run_options.stdin_content = *json;
  run_options.temp_directory = options_.temp_directory;
  VLOG(1) << "Calling model with " << messages.size() << " messages";
  absl::StatusOr<proto::CommandResult> result =
      process::RunCommand({"/bin/sh", "-c", options_.command}, run_options);
  if (!result.ok()) {
    return util::MakeError(util::ErrorKind::kModelFatal,
                           result.status().message());
  }
  if (result->timed_out()) {
    return util::MakeError(util::ErrorKind::kModelTransient,
                           absl::StrCat("Model command timed out after ",
                                        result->wall_time_millis(), "ms"));
  }
  if (result->exit_code() == kTransientExitCode) {
    return util::MakeError(
        util::ErrorKind::kModelTransient,
        absl::StrCat("Model command asked for a retry: ", result->stderr()));
  }
  if (result->exit_code() != 0) {
    return util::MakeError(
        util::ErrorKind::kModelFatal,
        absl::StrCat("Model command failed with exit code ",
                     result->exit_code(), ": ", result->stderr()));
  }

  proto::ModelResponse response;
  absl::Status status = util::FromJson(result->stdout(), &response);
  if (!status.ok()) {
    return util::MakeError(
        util::ErrorKind::kModelFatal,
        absl::StrCat("Invalid model response: ", status.message()));
  }
  if (!response.error().empty()) {
    return util::MakeError(response.retryable()
                               ? util::ErrorKind::kModelTransient
                               : util::ErrorKind::kModelFatal,
                           response.error());
  }
  proto::Message message = response.message();
  message.set_role(proto::ASSISTANT);
  return message;
}

}  // namespace agent
