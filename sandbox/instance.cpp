#include "sandbox/instance.hpp"

#include "glog/logging.h"

namespace sandbox {

absl::StatusOr<std::unique_ptr<ScopedInstance>> ScopedInstance::Start(
    IsolationProvider* provider, const StartOptions& options) {
  absl::StatusOr<Instance> instance = provider->Start(options);
  if (!instance.ok()) return instance.status();
  return std::unique_ptr<ScopedInstance>(
      new ScopedInstance(provider, std::move(*instance)));
}

absl::Status ScopedInstance::Teardown() {
  if (instance_.state == InstanceState::kRemoved) return absl::OkStatus();
  absl::Status stopped = provider_->Stop(&instance_);
  if (!stopped.ok()) {
    LOG(WARNING) << "Cannot stop " << instance_.name << ": "
                 << stopped.message();
  }
  absl::Status removed = provider_->Remove(&instance_);
  if (!removed.ok()) {
    LOG(WARNING) << "Cannot remove " << instance_.name << ": "
                 << removed.message();
    return removed;
  }
  VLOG(1) << "Removed instance " << instance_.name;
  return stopped;
}

ScopedInstance::~ScopedInstance() {
  absl::Status status = Teardown();
  if (!status.ok()) {
    LOG(ERROR) << "Instance " << instance_.name
               << " was not torn down cleanly: " << status;
  }
}

}  // namespace sandbox
