#ifndef GRADING_GRADING_PIPELINE_HPP
#define GRADING_GRADING_PIPELINE_HPP

#include <string>

#include "absl/status/status.h"
#include "executor/command_executor.hpp"
#include "proto/report.pb.h"
#include "proto/task.pb.h"
#include "sandbox/provider.hpp"

namespace grading {

// Grammar used when a task does not name one.
extern const char* const kDefaultTestGrammar;

struct GradingOptions {
  // Run the evaluation even when the patch is empty.
  bool grade_empty_patch = false;
  // Lenient apply command; the patch path is appended.
  std::string fuzzy_apply_command =
      "patch --batch --fuzz=5 -p1 --no-backup-if-mismatch -i";
  int64_t test_timeout_millis = 1800 * 1000;
  // Preamble, working directory and default timeout of every command.
  executor::ExecutorOptions executor;
  // Host directory for the files copied into the instance.
  std::string temp_directory = "/tmp";
};

// Grades a patch on a fresh instance: apply, run the evaluation script,
// parse its output and decide whether the task is resolved.
class GradingPipeline {
 public:
  GradingPipeline(sandbox::IsolationProvider* provider, GradingOptions options)
      : provider_(provider), options_(std::move(options)) {}

  // Never fails: sandbox problems are reported as a GRADING_ERROR outcome.
  // When artifact_dir is not empty, the patch, the apply and test logs, the
  // post-apply diff and the report are written there as they are produced.
  proto::GradingReport Grade(const proto::TaskSpec& task,
                             const sandbox::StartOptions& start,
                             const std::string& patch,
                             const std::string& artifact_dir);

 private:
  // Errors returned here end the grading with a GRADING_ERROR outcome.
  absl::Status Run(const proto::TaskSpec& task,
                   const sandbox::StartOptions& start,
                   const std::string& patch, const std::string& artifact_dir,
                   proto::GradingReport* report);
  absl::Status ApplyPatch(executor::CommandExecutor* executor,
                          const std::string& patch_path,
                          const std::string& artifact_dir,
                          proto::GradingReport* report);

  sandbox::IsolationProvider* provider_;
  GradingOptions options_;
};

// Decides resolution from the parsed statuses. With required tests, all of
// them must have passed; without, or when the grammar names no tests, the run
// must have exited with 0 and no parsed test may have failed.
bool IsResolved(const proto::TaskSpec& task,
                const proto::GradingReport& report, int32_t exit_code,
                bool reports_tests = true);

}  // namespace grading

#endif
