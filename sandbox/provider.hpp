#ifndef SANDBOX_PROVIDER_HPP
#define SANDBOX_PROVIDER_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "proto/command.pb.h"

namespace sandbox {

enum class InstanceState { kCreated, kRunning, kStopped, kRemoved };

const char* InstanceStateName(InstanceState state);

// A named, disposable environment holding one task's repository.
struct Instance {
  std::string name;
  std::string image;
  InstanceState state = InstanceState::kCreated;
  // Directory where transient files (patches, scripts) can be copied to.
  std::string scratch_dir;
  // Host directory backing the instance, when the provider has one.
  std::string host_root;
  // Variables set for every command run in the instance.
  std::vector<std::pair<std::string, std::string>> env;
};

struct StartOptions {
  std::string image;
  std::string name;
  std::vector<std::pair<std::string, std::string>> env;
};

struct ProviderOptions {
  std::string temp_directory = "/tmp";
  // Timeout of start, copy, stop and remove operations.
  int64_t provision_timeout_millis = 600 * 1000;
  bool pull = false;
};

// Isolation provider interface. Implementations register themselves by
// creating a global object of type IsolationProvider::Register<Impl> with
// their name, and define a static Create(const ProviderOptions&) function.
// Registering is not thread-safe and happens before main.
class IsolationProvider {
 public:
  using create_t = std::function<IsolationProvider*(const ProviderOptions&)>;
  static std::unique_ptr<IsolationProvider> Create(
      const std::string& name, const ProviderOptions& options);
  static std::vector<std::string> Names();

  virtual std::string Name() const = 0;

  // Starts a new instance. The returned instance is Running.
  virtual absl::StatusOr<Instance> Start(const StartOptions& options) = 0;

  // Runs command with /bin/bash -c inside the instance and waits for it for
  // at most timeout_millis. Returns a ProvisioningError when the command could
  // not be delivered to the instance.
  virtual absl::StatusOr<proto::CommandResult> Exec(
      const Instance& instance, const std::string& command,
      int64_t timeout_millis) = 0;

  virtual absl::Status CopyIn(const Instance& instance,
                              const std::string& host_path,
                              const std::string& sandbox_path) = 0;
  virtual absl::Status CopyOut(const Instance& instance,
                               const std::string& sandbox_path,
                               const std::string& host_path) = 0;

  virtual absl::Status Stop(Instance* instance) = 0;
  virtual absl::Status Remove(Instance* instance) = 0;

  virtual ~IsolationProvider() = default;
  IsolationProvider() = default;
  IsolationProvider(const IsolationProvider&) = delete;
  IsolationProvider(IsolationProvider&&) = delete;
  IsolationProvider& operator=(const IsolationProvider&) = delete;
  IsolationProvider& operator=(IsolationProvider&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const std::string& name) {
      IsolationProvider::Register_(name, &T::Create);
    }
  };

 private:
  using store_t = std::map<std::string, create_t>;
  static store_t* Providers_();
  static void Register_(const std::string& name, create_t create);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
