#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP

#include <string>
#include <vector>

#include "sandbox/provider.hpp"

namespace sandbox {

// Instances are containers driven through the docker command line client.
// The container idles on `tail -f /dev/null` and every command is a
// `docker exec`.
class Docker : public IsolationProvider {
 public:
  std::string Name() const override { return "docker"; }
  absl::StatusOr<Instance> Start(const StartOptions& options) override;
  absl::StatusOr<proto::CommandResult> Exec(const Instance& instance,
                                            const std::string& command,
                                            int64_t timeout_millis) override;
  absl::Status CopyIn(const Instance& instance, const std::string& host_path,
                      const std::string& sandbox_path) override;
  absl::Status CopyOut(const Instance& instance,
                       const std::string& sandbox_path,
                       const std::string& host_path) override;
  absl::Status Stop(Instance* instance) override;
  absl::Status Remove(Instance* instance) override;

  static IsolationProvider* Create(const ProviderOptions& options) {
    return new Docker(options);
  }

  // Command lines, exposed for tests.
  static std::vector<std::string> RunArgs(const StartOptions& options);
  static std::vector<std::string> ExecArgs(const std::string& name,
                                           const std::string& command,
                                           int64_t timeout_millis);

  // Grace period between the in-container TERM and KILL on timeout.
  static const constexpr int64_t kKillAfterSeconds = 5;

 private:
  explicit Docker(ProviderOptions options) : options_(std::move(options)) {}

  // Runs a docker subcommand; any nonzero exit is a ProvisioningError.
  absl::StatusOr<proto::CommandResult> Docker_(
      const std::vector<std::string>& args, const std::string& what);

  ProviderOptions options_;
};

}  // namespace sandbox

#endif
