#include "sandbox/local.hpp"

#include <vector>

#include "glog/logging.h"
#include "process/run.hpp"
#include "util/status.hpp"

namespace sandbox {

namespace {
const constexpr char* kRepoDir = "repo";
const constexpr char* kScratchDir = "scratch";
}  // namespace

std::string Local::Resolve(const Instance& instance, const std::string& path) {
  return util::File::JoinPath(instance.host_root, path);
}

absl::StatusOr<Instance> Local::Start(const StartOptions& options) {
  {
    absl::MutexLock lck(&mutex_);
    if (dirs_.count(options.name)) {
      return util::ProvisioningError("Instance " + options.name +
                                     " already exists");
    }
  }
  if (!util::File::Exists(options.image)) {
    return util::ProvisioningError("Image directory " + options.image +
                                   " does not exist");
  }
  std::unique_ptr<util::TempDir> dir;
  Instance instance;
  try {
    dir.reset(new util::TempDir(options_.temp_directory));
    instance.host_root = util::File::JoinPath(dir->Path(), kRepoDir);
    instance.scratch_dir = util::File::JoinPath(dir->Path(), kScratchDir);
    util::File::CopyTree(options.image, instance.host_root);
    util::File::MakeDirs(instance.scratch_dir);
  } catch (const std::system_error& exc) {
    return util::ProvisioningError("Cannot create instance " + options.name +
                                   ": " + exc.what());
  }
  instance.name = options.name;
  instance.image = options.image;
  instance.env = options.env;
  instance.state = InstanceState::kRunning;
  VLOG(1) << "Local instance " << instance.name << " in "
          << instance.host_root;
  absl::MutexLock lck(&mutex_);
  dirs_[options.name] = std::move(dir);
  return instance;
}

absl::StatusOr<proto::CommandResult> Local::Exec(const Instance& instance,
                                                 const std::string& command,
                                                 int64_t timeout_millis) {
  if (instance.state != InstanceState::kRunning) {
    return util::ProvisioningError("Instance " + instance.name + " is " +
                                   InstanceStateName(instance.state));
  }
  process::RunOptions run_options;
  run_options.root = instance.host_root;
  run_options.timeout_millis = timeout_millis;
  run_options.temp_directory = options_.temp_directory;
  std::vector<std::string> argv = {"/usr/bin/env"};
  for (const auto& kv : instance.env) {
    argv.push_back(kv.first + "=" + kv.second);
  }
  for (const char* arg : {"/bin/bash", "-c"}) argv.push_back(arg);
  argv.push_back(command);
  absl::StatusOr<proto::CommandResult> result =
      process::RunCommand(argv, run_options);
  if (result.ok() && result->timed_out()) result->set_exit_code(124);
  return result;
}

absl::Status Local::CopyIn(const Instance& instance,
                           const std::string& host_path,
                           const std::string& sandbox_path) {
  try {
    util::File::Copy(host_path, Resolve(instance, sandbox_path),
                     /*overwrite=*/true);
  } catch (const std::system_error& exc) {
    return util::ProvisioningError(exc.what());
  }
  return absl::OkStatus();
}

absl::Status Local::CopyOut(const Instance& instance,
                            const std::string& sandbox_path,
                            const std::string& host_path) {
  try {
    util::File::Copy(Resolve(instance, sandbox_path), host_path,
                     /*overwrite=*/true);
  } catch (const std::system_error& exc) {
    return util::ProvisioningError(exc.what());
  }
  return absl::OkStatus();
}

absl::Status Local::Stop(Instance* instance) {
  if (instance->state == InstanceState::kRunning)
    instance->state = InstanceState::kStopped;
  return absl::OkStatus();
}

absl::Status Local::Remove(Instance* instance) {
  std::unique_ptr<util::TempDir> dir;
  {
    absl::MutexLock lck(&mutex_);
    auto it = dirs_.find(instance->name);
    if (it != dirs_.end()) {
      dir = std::move(it->second);
      dirs_.erase(it);
    }
  }
  if (dir) {
    try {
      util::File::RemoveTree(dir->Path());
    } catch (const std::system_error& exc) {
      return util::ProvisioningError(exc.what());
    }
    dir->Keep();
  }
  instance->state = InstanceState::kRemoved;
  return absl::OkStatus();
}

namespace {
IsolationProvider::Register<Local> r("local");
}  // namespace

}  // namespace sandbox
