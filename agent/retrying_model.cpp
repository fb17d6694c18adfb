#include "agent/retrying_model.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "glog/logging.h"
#include "util/status.hpp"

namespace agent {

RetryingModelProvider::RetryingModelProvider(ModelProvider* inner,
                                             RetryOptions options,
                                             Sleeper sleeper)
    : inner_(inner), options_(options), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](int64_t millis) {
      std::this_thread::sleep_for(std::chrono::milliseconds(millis));
    };
  }
}

absl::StatusOr<proto::Message> RetryingModelProvider::Complete(
    const std::vector<proto::Message>& messages,
    const std::vector<proto::ToolDescriptor>& tools,
    const proto::CompletionOptions& options) {
  int64_t backoff = options_.initial_backoff_millis;
  int32_t attempts = std::max(options_.max_attempts, 1);
  for (int32_t attempt = 1;; attempt++) {
    absl::StatusOr<proto::Message> message =
        inner_->Complete(messages, tools, options);
    if (message.ok()) return message;
    if (util::GetErrorKind(message.status()) !=
        util::ErrorKind::kModelTransient) {
      return message;
    }
    if (attempt >= attempts) {
      LOG(ERROR) << "Model still failing after " << attempt
                 << " attempts: " << message.status().message();
      return message;
    }
    LOG(WARNING) << "Model call failed (attempt " << attempt << "/"
                 << attempts << "), retrying in " << backoff
                 << "ms: " << message.status().message();
    sleeper_(backoff);
    backoff = std::min(backoff * 2, options_.max_backoff_millis);
  }
}

}  // namespace agent
