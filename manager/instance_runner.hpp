#ifndef MANAGER_INSTANCE_RUNNER_HPP
#define MANAGER_INSTANCE_RUNNER_HPP

#include <atomic>
#include <string>

#include "absl/types/optional.h"
#include "agent/agent_loop.hpp"
#include "agent/model.hpp"
#include "executor/command_executor.hpp"
#include "grading/grading_pipeline.hpp"
#include "manager/event_queue.hpp"
#include "proto/report.pb.h"
#include "proto/task.pb.h"
#include "sandbox/provider.hpp"
#include "workspace/file_store.hpp"

namespace manager {

struct RunnerOptions {
  // Root of the per-instance artifact directories.
  std::string output_dir;
  std::string image_prefix;
  // Repository directory used when a task does not name one.
  std::string default_workdir = "/testbed";
  // Preamble and default timeout of the commands; the working directory is
  // taken from the task.
  executor::ExecutorOptions executor;
  size_t write_chunk_bytes = workspace::FileMutationStore::kDefaultChunkBytes;
  agent::AgentOptions agent;
  grading::GradingOptions grading;
};

// Processes one instance: the agent authors a patch on a first sandbox, the
// patch is extracted and then graded on a second one. Every outcome,
// including errors, ends up in the returned result.
class InstanceRunner {
 public:
  // model may be null when only predictions are graded.
  InstanceRunner(sandbox::IsolationProvider* provider,
                 agent::ModelProvider* model, EventQueue* events,
                 RunnerOptions options,
                 const std::atomic<bool>* cancelled = nullptr)
      : provider_(provider),
        model_(model),
        events_(events),
        options_(std::move(options)),
        cancelled_(cancelled) {}

  // Authors a patch with the agent, unless prediction is set, and grades it.
  // Writes the artifacts of the instance under output_dir/<instance_id>.
  proto::InstanceResult Run(const proto::TaskSpec& task,
                            const absl::optional<std::string>& prediction);

  InstanceRunner(const InstanceRunner&) = delete;
  InstanceRunner& operator=(const InstanceRunner&) = delete;

 private:
  // Runs the agent and fills the iteration and patch of result. The patch
  // written so far is extracted even when the loop failed, unless the
  // sandbox itself is gone.
  void Author(const proto::TaskSpec& task, const std::string& dir,
              proto::InstanceResult* result);
  std::string Workdir(const proto::TaskSpec& task) const;
  bool Cancelled() const { return cancelled_ != nullptr && *cancelled_; }

  sandbox::IsolationProvider* provider_;
  agent::ModelProvider* model_;
  EventQueue* events_;
  RunnerOptions options_;
  const std::atomic<bool>* cancelled_;
};

// Fills report for an instance whose patch was never graded.
void SetNotGraded(const std::string& instance_id, const std::string& reason,
                  proto::GradingReport* report);

// Instance name usable by container runtimes: [A-Za-z0-9_.-], starting with
// an alphanumeric character.
std::string InstanceName(const std::string& instance_id,
                         const std::string& suffix);

}  // namespace manager

#endif
