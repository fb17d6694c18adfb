#ifndef EXECUTOR_COMMAND_EXECUTOR_HPP
#define EXECUTOR_COMMAND_EXECUTOR_HPP

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "proto/command.pb.h"
#include "sandbox/provider.hpp"

namespace executor {

// Replaces empty output of a successful command.
extern const char* const kEmptyOutputSentinel;

// Exit code reported for commands killed by their timeout.
static const constexpr int32_t kTimeoutExitCode = 124;

struct ExecutorOptions {
  // Shell prefix run before every command, e.g. environment activation.
  std::string preamble;
  // Directory commands start from.
  std::string workdir = ".";
  int64_t default_timeout_millis = 120 * 1000;
};

// Runs shell commands inside one running instance.
class CommandExecutor {
 public:
  CommandExecutor(sandbox::IsolationProvider* provider,
                  const sandbox::Instance* instance, ExecutorOptions options)
      : provider_(provider), instance_(instance), options_(std::move(options)) {}

  // Runs command after the preamble, from the working directory. A timeout of
  // 0 uses the default one. Bytes of the output that are not UTF-8 are
  // replaced with U+FFFD. Returns a ProvisioningError only when the command
  // could not be run at all.
  absl::StatusOr<proto::CommandResult> Execute(const std::string& command,
                                               int64_t timeout_millis = 0);

  // Same as Execute, but the output is returned byte for byte, even when
  // empty.
  absl::StatusOr<proto::CommandResult> ExecuteRaw(const std::string& command,
                                                  int64_t timeout_millis = 0);

  // The full command line sent to the instance.
  std::string Wrap(const std::string& command) const;

  absl::Status CopyIn(const std::string& host_path,
                      const std::string& sandbox_path) {
    return provider_->CopyIn(*instance_, host_path, sandbox_path);
  }

  const sandbox::Instance& instance() const { return *instance_; }
  const ExecutorOptions& options() const { return options_; }

  CommandExecutor(const CommandExecutor&) = delete;
  CommandExecutor& operator=(const CommandExecutor&) = delete;
  CommandExecutor(CommandExecutor&&) = delete;
  CommandExecutor& operator=(CommandExecutor&&) = delete;
  ~CommandExecutor() = default;

 private:
  sandbox::IsolationProvider* provider_;
  const sandbox::Instance* instance_;
  ExecutorOptions options_;
};

// OK when result is a success; otherwise a CommandTimeout or CommandFailure
// error mentioning what and the command's stderr.
absl::Status CheckSucceeded(const proto::CommandResult& result,
                            const std::string& what);

// Human readable rendering of a result, as shown to the agent.
std::string FormatResult(const proto::CommandResult& result);

}  // namespace executor

#endif
