#include "agent/conversation.hpp"

#include "glog/logging.h"
#include "util/json.hpp"

namespace agent {

void ConversationLog::Persist(const proto::Message& message) {
  if (history_path_.empty()) return;
  absl::Status status = util::AppendJsonLine(history_path_, message);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot append to " << history_path_ << ": " << status;
  }
}

void ConversationLog::Append(proto::Message message) {
  Persist(message);
  window_.push_back(std::move(message));
}

void ConversationLog::Reset(const std::string& reason) {
  proto::Message marker;
  marker.set_role(proto::RESET);
  marker.set_content(reason);
  Persist(marker);
  window_.clear();
}

}  // namespace agent
