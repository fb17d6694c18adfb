#include "manager/task_loader.hpp"

#include <algorithm>
#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "proto/report.pb.h"
#include "util/file.hpp"
#include "util/json.hpp"
#include "util/status.hpp"

namespace manager {

namespace {
absl::Status ParseRange(const std::string& range, size_t size, size_t* start,
                        size_t* end) {
  *start = 0;
  *end = size;
  if (range.empty()) return absl::OkStatus();
  std::vector<std::string> parts = absl::StrSplit(range, ':');
  if (parts.size() != 2) {
    return util::InvalidInput("Invalid instance range " + range);
  }
  int64_t value = 0;
  if (!parts[0].empty()) {
    if (!absl::SimpleAtoi(parts[0], &value) || value < 0) {
      return util::InvalidInput("Invalid instance range " + range);
    }
    *start = std::min<size_t>(value, size);
  }
  if (!parts[1].empty()) {
    if (!absl::SimpleAtoi(parts[1], &value) || value < 0) {
      return util::InvalidInput("Invalid instance range " + range);
    }
    *end = std::min<size_t>(value, size);
  }
  if (*end < *start) *end = *start;
  return absl::OkStatus();
}
}  // namespace

absl::StatusOr<std::vector<proto::TaskSpec>> LoadTasks(
    const std::string& path) {
  absl::StatusOr<std::vector<proto::TaskSpec>> tasks =
      util::ReadJsonLines<proto::TaskSpec>(path);
  if (!tasks.ok()) return tasks.status();
  std::set<std::string> ids;
  for (const proto::TaskSpec& task : *tasks) {
    if (task.instance_id().empty()) {
      return util::InvalidInput(path + ": a task has no instance_id");
    }
    if (!ids.insert(task.instance_id()).second) {
      return util::InvalidInput(path + ": duplicate instance_id " +
                                task.instance_id());
    }
  }
  LOG(INFO) << "Loaded " << tasks->size() << " tasks from " << path;
  return tasks;
}

absl::StatusOr<std::vector<proto::TaskSpec>> SelectTasks(
    const std::vector<proto::TaskSpec>& tasks, const Selection& selection) {
  size_t start = 0;
  size_t end = 0;
  absl::Status status =
      ParseRange(selection.instance_range, tasks.size(), &start, &end);
  if (!status.ok()) return status;

  std::set<std::string> wanted;
  for (absl::string_view id :
       absl::StrSplit(selection.instance_ids, ',', absl::SkipWhitespace())) {
    wanted.emplace(absl::StripAsciiWhitespace(id));
  }
  std::set<std::string> known;
  for (const proto::TaskSpec& task : tasks) known.insert(task.instance_id());
  for (const std::string& id : wanted) {
    if (!known.count(id)) return util::InvalidInput("Unknown instance " + id);
  }

  std::set<std::string> completed;
  if (!selection.completed_results.empty() &&
      util::File::Exists(selection.completed_results)) {
    absl::StatusOr<std::vector<proto::InstanceResult>> results =
        util::ReadJsonLines<proto::InstanceResult>(
            selection.completed_results);
    if (!results.ok()) return results.status();
    for (const proto::InstanceResult& result : *results) {
      completed.insert(result.instance_id());
    }
  }

  std::vector<proto::TaskSpec> selected;
  for (size_t i = start; i < end; i++) {
    const proto::TaskSpec& task = tasks[i];
    if (!wanted.empty() && !wanted.count(task.instance_id())) continue;
    if (completed.count(task.instance_id())) {
      VLOG(1) << "Skipping completed instance " << task.instance_id();
      continue;
    }
    selected.push_back(task);
  }
  return selected;
}

absl::StatusOr<std::map<std::string, std::string>> LoadPredictions(
    const std::string& path) {
  absl::StatusOr<std::vector<proto::Prediction>> predictions =
      util::ReadJsonLines<proto::Prediction>(path);
  if (!predictions.ok()) return predictions.status();
  std::map<std::string, std::string> patches;
  for (const proto::Prediction& prediction : *predictions) {
    if (prediction.instance_id().empty()) {
      return util::InvalidInput(path + ": a prediction has no instance_id");
    }
    patches[prediction.instance_id()] = prediction.model_patch();
  }
  return patches;
}

std::string ImageName(const std::string& prefix, const proto::TaskSpec& task) {
  if (!task.repo_image_ref().empty()) return task.repo_image_ref();
  std::string name = absl::AsciiStrToLower(absl::StrCat(
      "sweb.eval.x86_64.",
      absl::StrReplaceAll(task.instance_id(), {{"__", "_s_"}})));
  if (prefix.empty()) return name;
  return absl::StrCat(prefix, "/", name);
}

}  // namespace manager
