#ifndef AGENT_RETRYING_MODEL_HPP
#define AGENT_RETRYING_MODEL_HPP

#include <functional>

#include "agent/model.hpp"

namespace agent {

struct RetryOptions {
  int32_t max_attempts = 5;
  int64_t initial_backoff_millis = 2000;
  int64_t max_backoff_millis = 60000;
};

// Retries the ModelTransient failures of another provider, doubling the
// wait after every attempt. Other failures are returned immediately.
class RetryingModelProvider : public ModelProvider {
 public:
  using Sleeper = std::function<void(int64_t millis)>;

  RetryingModelProvider(ModelProvider* inner, RetryOptions options,
                        Sleeper sleeper = nullptr);

  absl::StatusOr<proto::Message> Complete(
      const std::vector<proto::Message>& messages,
      const std::vector<proto::ToolDescriptor>& tools,
      const proto::CompletionOptions& options) override;

 private:
  ModelProvider* inner_;
  RetryOptions options_;
  Sleeper sleeper_;
};

}  // namespace agent

#endif
