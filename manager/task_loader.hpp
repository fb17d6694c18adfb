#ifndef MANAGER_TASK_LOADER_HPP
#define MANAGER_TASK_LOADER_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "proto/task.pb.h"

namespace manager {

struct Selection {
  // Comma separated instance ids; empty selects every task.
  std::string instance_ids;
  // "start:end", 0-based with end excluded; either side may be omitted.
  std::string instance_range;
  // Skips the instances already present in this results file, if set.
  std::string completed_results;
};

// Reads a JSON Lines file of TaskSpec. Every task needs a unique id.
absl::StatusOr<std::vector<proto::TaskSpec>> LoadTasks(const std::string& path);

// Applies the range, then the id list, then drops the completed instances.
absl::StatusOr<std::vector<proto::TaskSpec>> SelectTasks(
    const std::vector<proto::TaskSpec>& tasks, const Selection& selection);

// instance_id -> patch, from a JSON Lines file of Prediction.
absl::StatusOr<std::map<std::string, std::string>> LoadPredictions(
    const std::string& path);

// The image of a task: its own reference, or the one derived from its id.
std::string ImageName(const std::string& prefix, const proto::TaskSpec& task);

}  // namespace manager

#endif
