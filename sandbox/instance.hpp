#ifndef SANDBOX_INSTANCE_HPP
#define SANDBOX_INSTANCE_HPP

#include <memory>

#include "absl/status/statusor.h"
#include "sandbox/provider.hpp"

namespace sandbox {

// Owns a running instance for the duration of one phase. The instance is
// stopped and removed when the guard goes away, whatever happened in between.
class ScopedInstance {
 public:
  static absl::StatusOr<std::unique_ptr<ScopedInstance>> Start(
      IsolationProvider* provider, const StartOptions& options);

  // Stops and removes the instance. Safe to call more than once.
  absl::Status Teardown();

  const Instance& instance() const { return instance_; }
  IsolationProvider* provider() const { return provider_; }

  ~ScopedInstance();
  ScopedInstance(const ScopedInstance&) = delete;
  ScopedInstance(ScopedInstance&&) = delete;
  ScopedInstance& operator=(const ScopedInstance&) = delete;
  ScopedInstance& operator=(ScopedInstance&&) = delete;

 private:
  ScopedInstance(IsolationProvider* provider, Instance instance)
      : provider_(provider), instance_(std::move(instance)) {}

  IsolationProvider* provider_;
  Instance instance_;
};

}  // namespace sandbox

#endif
