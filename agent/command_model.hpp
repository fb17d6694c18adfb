#ifndef AGENT_COMMAND_MODEL_HPP
#define AGENT_COMMAND_MODEL_HPP

#include <string>

#include "agent/model.hpp"

namespace agent {

// Exit code of the model command asking for a retry (EX_TEMPFAIL).
static const constexpr int32_t kTransientExitCode = 75;

struct CommandModelOptions {
  // Shell command line of the model program.
  std::string command;
  int64_t timeout_millis = 600 * 1000;
  std::string temp_directory = "/tmp";
};

// Talks to a model through an external program: a proto::ModelRequest is
// written as JSON to its stdin and a proto::ModelResponse is expected as JSON
// on its stdout.
class CommandModelProvider : public ModelProvider {
 public:
  explicit CommandModelProvider(CommandModelOptions options)
      : options_(std::move(options)) {}

  absl::StatusOr<proto::Message> Complete(
      const std::vector<proto::Message>& messages,
      const std::vector<proto::ToolDescriptor>& tools,
      const proto::CompletionOptions& options) override;

 private:
  CommandModelOptions options_;
};

}  // namespace agent

#endif
