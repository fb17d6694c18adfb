#include "sandbox/docker.hpp"

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "process/run.hpp"
#include "util/status.hpp"

namespace sandbox {

namespace {
const constexpr char* kScratchDir = "/tmp";

bool IsDaemonError(const proto::CommandResult& result) {
  return absl::StartsWith(result.stderr(), "Error response from daemon") ||
         absl::StartsWith(result.stderr(), "Error: No such container");
}
}  // namespace

constexpr int64_t Docker::kKillAfterSeconds;

std::vector<std::string> Docker::RunArgs(const StartOptions& options) {
  std::vector<std::string> args = {"docker", "run", "-d", "--name",
                                   options.name};
  for (const auto& kv : options.env) {
    args.push_back("-e");
    args.push_back(kv.first + "=" + kv.second);
  }
  args.push_back(options.image);
  for (const char* arg : {"tail", "-f", "/dev/null"}) args.push_back(arg);
  return args;
}

std::vector<std::string> Docker::ExecArgs(const std::string& name,
                                          const std::string& command,
                                          int64_t timeout_millis) {
  std::vector<std::string> args = {"docker", "exec", name};
  if (timeout_millis > 0) {
    args.push_back("timeout");
    args.push_back(absl::StrCat("--kill-after=", kKillAfterSeconds));
    args.push_back(absl::StrFormat("%.3f", timeout_millis / 1000.0));
  }
  for (const char* arg : {"/bin/bash", "-c"}) args.push_back(arg);
  args.push_back(command);
  return args;
}

absl::StatusOr<proto::CommandResult> Docker::Docker_(
    const std::vector<std::string>& args, const std::string& what) {
  process::RunOptions run_options;
  run_options.timeout_millis = options_.provision_timeout_millis;
  run_options.temp_directory = options_.temp_directory;
  absl::StatusOr<proto::CommandResult> result =
      process::RunCommand(args, run_options);
  if (!result.ok()) return result.status();
  if (result->timed_out()) {
    return util::ProvisioningError(what + ": timed out");
  }
  if (result->exit_code() != 0) {
    return util::ProvisioningError(what + ": " + result->stderr());
  }
  return result;
}

absl::StatusOr<Instance> Docker::Start(const StartOptions& options) {
  if (options_.pull) {
    LOG(INFO) << "Pulling " << options.image;
    auto pulled = Docker_({"docker", "pull", options.image},
                          "docker pull " + options.image);
    if (!pulled.ok()) return pulled.status();
  }
  // A container left over by a previous run would make the name clash.
  auto stale = Docker_({"docker", "rm", "-f", options.name},
                       "docker rm " + options.name);
  if (!stale.ok()) VLOG(1) << stale.status().message();

  auto started = Docker_(RunArgs(options), "docker run " + options.image);
  if (!started.ok()) return started.status();
  Instance instance;
  instance.name = options.name;
  instance.image = options.image;
  instance.scratch_dir = kScratchDir;
  instance.state = InstanceState::kRunning;
  LOG(INFO) << "Started container " << instance.name << " from "
            << instance.image;
  return instance;
}

absl::StatusOr<proto::CommandResult> Docker::Exec(const Instance& instance,
                                                  const std::string& command,
                                                  int64_t timeout_millis) {
  if (instance.state != InstanceState::kRunning) {
    return util::ProvisioningError("Container " + instance.name + " is " +
                                   InstanceStateName(instance.state));
  }
  process::RunOptions run_options;
  run_options.temp_directory = options_.temp_directory;
  if (timeout_millis > 0) {
    // The in-container timeout fires first; this one only catches a stuck
    // client.
    run_options.timeout_millis =
        timeout_millis + 2 * kKillAfterSeconds * 1000;
  }
  absl::StatusOr<proto::CommandResult> result = process::RunCommand(
      ExecArgs(instance.name, command, timeout_millis), run_options);
  if (!result.ok()) return result.status();
  if (IsDaemonError(*result)) {
    return util::ProvisioningError("docker exec on " + instance.name + ": " +
                                   result->stderr());
  }
  // timeout(1) exits with 124 when the limit expired, 137 when it had to
  // resort to KILL.
  if (timeout_millis > 0 &&
      (result->exit_code() == 124 || result->exit_code() == 137) &&
      result->wall_time_millis() >= timeout_millis) {
    result->set_timed_out(true);
  }
  return result;
}

absl::Status Docker::CopyIn(const Instance& instance,
                            const std::string& host_path,
                            const std::string& sandbox_path) {
  std::string target = instance.name + ":" + sandbox_path;
  return Docker_({"docker", "cp", host_path, target}, "docker cp " + host_path)
      .status();
}

absl::Status Docker::CopyOut(const Instance& instance,
                             const std::string& sandbox_path,
                             const std::string& host_path) {
  std::string source = instance.name + ":" + sandbox_path;
  return Docker_({"docker", "cp", source, host_path},
                 "docker cp " + sandbox_path)
      .status();
}

absl::Status Docker::Stop(Instance* instance) {
  if (instance->state != InstanceState::kRunning) return absl::OkStatus();
  auto stopped = Docker_({"docker", "stop", "-t", "5", instance->name},
                         "docker stop " + instance->name);
  if (!stopped.ok()) return stopped.status();
  instance->state = InstanceState::kStopped;
  return absl::OkStatus();
}

absl::Status Docker::Remove(Instance* instance) {
  if (instance->state == InstanceState::kRemoved) return absl::OkStatus();
  auto removed = Docker_({"docker", "rm", "-f", instance->name},
                         "docker rm " + instance->name);
  if (!removed.ok()) return removed.status();
  instance->state = InstanceState::kRemoved;
  return absl::OkStatus();
}

namespace {
IsolationProvider::Register<Docker> r("docker");
}  // namespace

}  // namespace sandbox
