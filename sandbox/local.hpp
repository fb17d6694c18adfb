#ifndef SANDBOX_LOCAL_HPP
#define SANDBOX_LOCAL_HPP

#include <map>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "sandbox/provider.hpp"
#include "util/file.hpp"

namespace sandbox {

// Instances are private copies of a host directory (the "image"), and
// commands run on the host with /bin/bash from the copy. There is no
// isolation beyond the working directory; this provider is meant for tests
// and dry runs of repositories that need no special toolchain.
class Local : public IsolationProvider {
 public:
  std::string Name() const override { return "local"; }
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
    return new Local(options);
  }

 private:
  explicit Local(ProviderOptions options) : options_(std::move(options)) {}

  // Relative paths are relative to the repository copy.
  static std::string Resolve(const Instance& instance, const std::string& path);

  ProviderOptions options_;
  absl::Mutex mutex_;
  std::map<std::string, std::unique_ptr<util::TempDir>> dirs_
      GUARDED_BY(mutex_);
};

}  // namespace sandbox

#endif
