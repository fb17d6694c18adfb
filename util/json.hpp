#ifndef UTIL_JSON_HPP
#define UTIL_JSON_HPP

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/message.h"

namespace util {

// Serializes message as single-line JSON with the proto field names.
absl::StatusOr<std::string> ToJson(const google::protobuf::Message& message);

// Parses JSON into message, ignoring unknown fields.
absl::Status FromJson(const std::string& json,
                      google::protobuf::Message* message);

// Reads a JSON file into message.
absl::Status ReadJsonFile(const std::string& path,
                          google::protobuf::Message* message);

// Atomically writes message as JSON to path.
absl::Status WriteJsonFile(const std::string& path,
                           const google::protobuf::Message& message);

// Appends message as one line of a JSON Lines file.
absl::Status AppendJsonLine(const std::string& path,
                            const google::protobuf::Message& message);

// Parses every non-empty line of a JSON Lines file.
template <typename T>
absl::StatusOr<std::vector<T>> ReadJsonLines(const std::string& path);

absl::StatusOr<std::vector<std::string>> ReadLines(const std::string& path);

template <typename T>
absl::StatusOr<std::vector<T>> ReadJsonLines(const std::string& path) {
  absl::StatusOr<std::vector<std::string>> lines = ReadLines(path);
  if (!lines.ok()) return lines.status();
  std::vector<T> messages;
  for (size_t i = 0; i < lines->size(); i++) {
    T message;
    absl::Status status = FromJson((*lines)[i], &message);
    if (!status.ok()) {
      return absl::Status(status.code(), path + ":" + std::to_string(i + 1) +
                                             ": " +
                                             std::string(status.message()));
    }
    messages.push_back(std::move(message));
  }
  return messages;
}

}  // namespace util

#endif
