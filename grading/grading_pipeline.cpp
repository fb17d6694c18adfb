#include "grading/grading_pipeline.hpp"

#include <memory>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "grading/test_log_parser.hpp"
#include "sandbox/instance.hpp"
#include "util/file.hpp"
#include "util/json.hpp"
#include "util/misc.hpp"
#include "util/status.hpp"
#include "workspace/patch_extractor.hpp"

namespace grading {

const char* const kDefaultTestGrammar = "pytest";

namespace {
void WriteArtifact(const std::string& dir, const std::string& name,
                   const std::string& content) {
  if (dir.empty()) return;
  try {
    util::File::Write(util::File::JoinPath(dir, name), content);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Cannot write " << name << " to " << dir << ": "
               << exc.what();
  }
}

std::string CommandLog(const std::string& command,
                       const proto::CommandResult& result) {
  return absl::StrCat("$ ", command, "\n", executor::FormatResult(result),
                      "\n");
}

bool Succeeded(const proto::CommandResult& result) {
  return !result.timed_out() && result.exit_code() == 0;
}
}  // namespace

bool IsResolved(const proto::TaskSpec& task,
                const proto::GradingReport& report, int32_t exit_code,
                bool reports_tests) {
  const auto& statuses = report.per_test_status();
  if (!reports_tests ||
      (task.fail_to_pass_size() == 0 && task.pass_to_pass_size() == 0)) {
    if (exit_code != 0) return false;
    for (const auto& test : statuses) {
      if (test.second != proto::PASS) return false;
    }
    return true;
  }
  for (const auto* tests : {&task.fail_to_pass(), &task.pass_to_pass()}) {
    for (const std::string& name : *tests) {
      auto it = statuses.find(name);
      if (it == statuses.end() || it->second != proto::PASS) return false;
    }
  }
  return true;
}

absl::Status GradingPipeline::ApplyPatch(executor::CommandExecutor* executor,
                                         const std::string& patch_path,
                                         const std::string& artifact_dir,
                                         proto::GradingReport* report) {
  std::string quoted = util::ShellQuote(patch_path);
  std::string strict = "git apply -v " + quoted;
  absl::StatusOr<proto::CommandResult> result = executor->ExecuteRaw(strict);
  if (!result.ok()) return result.status();
  std::string log = CommandLog(strict, *result);
  if (Succeeded(*result)) {
    report->set_apply_method(proto::DIRECT_APPLY);
  } else {
    std::string lenient = absl::StrCat(options_.fuzzy_apply_command, " ",
                                       quoted);
    result = executor->ExecuteRaw(lenient);
    if (!result.ok()) return result.status();
    absl::StrAppend(&log, CommandLog(lenient, *result));
    report->set_apply_method(Succeeded(*result) ? proto::FUZZY_PATCH
                                                : proto::FAILED);
  }
  report->set_patch_applied(report->apply_method() != proto::FAILED);
  WriteArtifact(artifact_dir, "apply.log", log);
  return absl::OkStatus();
}

absl::Status GradingPipeline::Run(const proto::TaskSpec& task,
                                  const sandbox::StartOptions& start,
                                  const std::string& patch,
                                  const std::string& artifact_dir,
                                  proto::GradingReport* report) {
  std::string grammar =
      task.test_grammar().empty() ? kDefaultTestGrammar : task.test_grammar();
  std::unique_ptr<TestLogParser> parser = TestLogParser::Create(grammar);
  if (parser == nullptr) {
    return util::InvalidInput("Unknown test grammar " + grammar);
  }
  if (patch.empty() && !options_.grade_empty_patch) {
    report->set_outcome(proto::EMPTY_PATCH);
    return absl::OkStatus();
  }
  if (task.eval_script().empty()) {
    return util::InvalidInput("Task " + task.instance_id() +
                              " has no evaluation script");
  }

  absl::StatusOr<std::unique_ptr<sandbox::ScopedInstance>> instance =
      sandbox::ScopedInstance::Start(provider_, start);
  if (!instance.ok()) return instance.status();
  const sandbox::Instance& target = (*instance)->instance();
  executor::ExecutorOptions executor_options = options_.executor;
  if (!task.workdir().empty()) executor_options.workdir = task.workdir();
  executor::CommandExecutor commands(provider_, &target, executor_options);

  std::unique_ptr<util::TempDir> temp;
  std::string host_patch;
  std::string host_script;
  try {
    temp.reset(new util::TempDir(options_.temp_directory));
    host_patch = util::File::JoinPath(temp->Path(), "patch.diff");
    host_script = util::File::JoinPath(temp->Path(), "eval.sh");
    util::File::Write(host_patch, patch);
    util::File::Write(host_script, task.eval_script());
  } catch (const std::system_error& exc) {
    return util::ProvisioningError(exc.what());
  }

  if (!patch.empty()) {
    std::string patch_path =
        util::File::JoinPath(target.scratch_dir, "fixbench.patch");
    absl::Status status = commands.CopyIn(host_patch, patch_path);
    if (!status.ok()) return status;
    status = ApplyPatch(&commands, patch_path, artifact_dir, report);
    if (!status.ok()) return status;
    if (!report->patch_applied()) {
      report->set_outcome(proto::PATCH_APPLY_FAILED);
      report->set_error_message("The patch does not apply");
      return absl::OkStatus();
    }
  }

  std::string baseline =
      task.base_commit().empty() ? "HEAD" : task.base_commit();
  workspace::PatchExtractor extractor(&commands, baseline);
  absl::StatusOr<std::string> eval_diff = extractor.Extract();
  if (eval_diff.ok()) {
    WriteArtifact(artifact_dir, "eval.diff", *eval_diff);
  } else if (util::GetErrorKind(eval_diff.status()) ==
             util::ErrorKind::kProvisioning) {
    return eval_diff.status();
  } else {
    LOG(WARNING) << "Cannot compute the evaluation diff of "
                 << task.instance_id() << ": " << eval_diff.status();
  }

  std::string script_path =
      util::File::JoinPath(target.scratch_dir, "fixbench_eval.sh");
  absl::Status status = commands.CopyIn(host_script, script_path);
  if (!status.ok()) return status;
  absl::StatusOr<proto::CommandResult> result = commands.ExecuteRaw(
      "bash " + util::ShellQuote(script_path), options_.test_timeout_millis);
  if (!result.ok()) return result.status();
  std::string output = result->stdout();
  if (!result->stderr().empty()) {
    if (!output.empty() && output.back() != '\n') output += '\n';
    output += result->stderr();
  }
  WriteArtifact(artifact_dir, "test_output.log", output);
  output = util::SanitizeUtf8(output);
  report->set_test_output(output);
  if (result->timed_out()) {
    report->set_outcome(proto::TEST_TIMEOUT);
    report->set_error_message(
        absl::StrCat("The evaluation timed out after ",
                     options_.test_timeout_millis / 1000, " seconds"));
    return absl::OkStatus();
  }

  for (const auto& test : parser->Parse(output)) {
    (*report->mutable_per_test_status())[test.first] = test.second;
  }
  report->set_resolved(IsResolved(task, *report, result->exit_code(),
                                  parser->ReportsTests()));
  report->set_outcome(report->resolved() ? proto::RESOLVED
                                         : proto::UNRESOLVED);
  return (*instance)->Teardown();
}

proto::GradingReport GradingPipeline::Grade(const proto::TaskSpec& task,
                                            const sandbox::StartOptions& start,
                                            const std::string& patch,
                                            const std::string& artifact_dir) {
  proto::GradingReport report;
  report.set_instance_id(task.instance_id());
  std::string normalized = workspace::NormalizePatch(patch);
  WriteArtifact(artifact_dir, "patch.diff", normalized);
  absl::Status status = Run(task, start, normalized, artifact_dir, &report);
  if (!status.ok() && report.outcome() == proto::OUTCOME_UNSPECIFIED) {
    report.set_outcome(proto::GRADING_ERROR);
    report.set_resolved(false);
    report.set_error_message(util::SanitizeUtf8(std::string(status.message())));
    LOG(ERROR) << "Cannot grade " << task.instance_id() << ": " << status;
  } else if (!status.ok()) {
    LOG(WARNING) << "Grading of " << task.instance_id()
                 << " finished with: " << status;
  }
  if (!artifact_dir.empty()) {
    absl::Status saved = util::WriteJsonFile(
        util::File::JoinPath(artifact_dir, "report.json"), report);
    if (!saved.ok()) LOG(ERROR) << "Cannot save the grading report: " << saved;
  }
  LOG(INFO) << task.instance_id() << " graded: "
            << proto::GradingOutcome_Name(report.outcome());
  return report;
}

}  // namespace grading
