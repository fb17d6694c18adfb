#ifndef AGENT_CONVERSATION_HPP
#define AGENT_CONVERSATION_HPP

#include <string>
#include <vector>

#include "proto/conversation.pb.h"

namespace agent {

// The messages of the current context window. Every message, and every
// reset, is also appended to a JSON Lines history file when a path is given.
class ConversationLog {
 public:
  explicit ConversationLog(std::string history_path = "")
      : history_path_(std::move(history_path)) {}

  void Append(proto::Message message);

  // Empties the window and records a RESET marker in the history.
  void Reset(const std::string& reason);

  const std::vector<proto::Message>& window() const { return window_; }

 private:
  void Persist(const proto::Message& message);

  std::string history_path_;
  std::vector<proto::Message> window_;
};

}  // namespace agent

#endif
