#include "util/json.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"
#include "util/status.hpp"

namespace util {

absl::StatusOr<std::string> ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return InvalidInput("Cannot serialize " + message.GetTypeName() + ": " +
                        status.ToString());
  }
  return json;
}

absl::Status FromJson(const std::string& json,
                      google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    return InvalidInput("Invalid " + message->GetTypeName() + ": " +
                        status.ToString());
  }
  return absl::OkStatus();
}

absl::Status ReadJsonFile(const std::string& path,
                          google::protobuf::Message* message) {
  std::string content;
  try {
    content = File::Read(path);
  } catch (const std::system_error& exc) {
    return InvalidInput(exc.what());
  }
  return FromJson(content, message);
}

absl::Status WriteJsonFile(const std::string& path,
                           const google::protobuf::Message& message) {
  absl::StatusOr<std::string> json = ToJson(message);
  if (!json.ok()) return json.status();
  try {
    File::Write(path, *json + "\n");
  } catch (const std::system_error& exc) {
    return absl::InternalError(exc.what());
  }
  return absl::OkStatus();
}

absl::Status AppendJsonLine(const std::string& path,
                            const google::protobuf::Message& message) {
  absl::StatusOr<std::string> json = ToJson(message);
  if (!json.ok()) return json.status();
  try {
    File::Append(path, *json + "\n");
  } catch (const std::system_error& exc) {
    return absl::InternalError(exc.what());
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<std::string>> ReadLines(const std::string& path) {
  std::string content;
  try {
    content = File::Read(path);
  } catch (const std::system_error& exc) {
    return InvalidInput(exc.what());
  }
  std::vector<std::string> lines;
  for (absl::string_view line : absl::StrSplit(content, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) lines.emplace_back(line);
  }
  return lines;
}

}  // namespace util
