#ifndef AGENT_MODEL_HPP
#define AGENT_MODEL_HPP

#include <vector>

#include "absl/status/statusor.h"
#include "proto/conversation.pb.h"

namespace agent {

// A language model able to continue a conversation. Failures are reported
// as ModelTransient (worth retrying) or ModelFatal errors.
class ModelProvider {
 public:
  virtual absl::StatusOr<proto::Message> Complete(
      const std::vector<proto::Message>& messages,
      const std::vector<proto::ToolDescriptor>& tools,
      const proto::CompletionOptions& options) = 0;

  ModelProvider() = default;
  virtual ~ModelProvider() = default;
  ModelProvider(const ModelProvider&) = delete;
  ModelProvider& operator=(const ModelProvider&) = delete;
};

}  // namespace agent

#endif
