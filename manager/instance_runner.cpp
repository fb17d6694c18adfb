#include "manager/instance_runner.hpp"

#include <cctype>
#include <memory>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "manager/task_loader.hpp"
#include "sandbox/instance.hpp"
#include "util/file.hpp"
#include "util/json.hpp"
#include "util/misc.hpp"
#include "util/status.hpp"
#include "workspace/patch_extractor.hpp"

namespace manager {

namespace {
const constexpr char* kGradingDir = "grading";

void SetError(const absl::Status& status, proto::InstanceResult* result) {
  if (!result->error_kind().empty()) return;
  result->set_error_kind(util::ErrorKindName(util::GetErrorKind(status)));
  result->set_error_message(util::SanitizeUtf8(std::string(status.message())));
}

void Persist(const std::string& path, const google::protobuf::Message& msg) {
  absl::Status status = util::WriteJsonFile(path, msg);
  if (!status.ok()) LOG(ERROR) << "Cannot write " << path << ": " << status;
}
}  // namespace

void SetNotGraded(const std::string& instance_id, const std::string& reason,
                  proto::GradingReport* report) {
  report->set_instance_id(instance_id);
  report->set_outcome(proto::NOT_GRADED);
  report->set_resolved(false);
  report->set_error_message(reason);
}

std::string InstanceName(const std::string& instance_id,
                         const std::string& suffix) {
  std::string name = absl::StrCat("fixbench-", instance_id, "-", suffix);
  for (char& c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' &&
        c != '.' && c != '-') {
      c = '-';
    }
  }
  return name;
}

std::string InstanceRunner::Workdir(const proto::TaskSpec& task) const {
  return task.workdir().empty() ? options_.default_workdir : task.workdir();
}

void InstanceRunner::Author(const proto::TaskSpec& task,
                            const std::string& dir,
                            proto::InstanceResult* result) {
  const std::string& id = task.instance_id();
  events_->Provisioning(id);
  sandbox::StartOptions start;
  start.image = ImageName(options_.image_prefix, task);
  start.name = InstanceName(id, "author");
  start.env.emplace_back("SWE_INSTANCE_ID", id);
  auto instance = sandbox::ScopedInstance::Start(provider_, start);
  if (!instance.ok()) {
    LOG(ERROR) << "Cannot start " << start.name << ": " << instance.status();
    SetError(instance.status(), result);
    return;
  }

  executor::ExecutorOptions executor_options = options_.executor;
  executor_options.workdir = Workdir(task);
  executor::CommandExecutor commands(provider_, &(*instance)->instance(),
                                     executor_options);
  std::string baseline =
      task.base_commit().empty() ? "HEAD" : task.base_commit();
  workspace::FileMutationStore store(&commands, baseline,
                                     options_.write_chunk_bytes);
  workspace::PatchExtractor extractor(&commands, baseline);

  agent::AgentOptions agent_options = options_.agent;
  agent_options.history_path = util::File::JoinPath(dir, "history.jsonl");
  agent_options.view_path = util::File::JoinPath(dir, "workspace.json");

  events_->Authoring(id);
  agent::AgentLoop loop(model_, &commands, &store, &extractor, agent_options,
                        cancelled_);
  absl::StatusOr<proto::IterationState> state =
      loop.Run(task.problem_statement());
  if (state.ok()) {
    *result->mutable_iteration() = *state;
    events_->Extracting(id);
    absl::StatusOr<std::string> patch = extractor.Extract();
    if (patch.ok()) {
      result->set_patch(*patch);
    } else {
      LOG(ERROR) << id << ": cannot extract the patch: " << patch.status();
      SetError(patch.status(), result);
    }
  } else {
    LOG(ERROR) << id << ": the agent stopped after "
               << loop.iteration().iteration_count()
               << " steps: " << state.status();
    *result->mutable_iteration() = loop.iteration();
    SetError(state.status(), result);
  }

  absl::Status teardown = (*instance)->Teardown();
  if (!teardown.ok()) LOG(WARNING) << teardown;
}

proto::InstanceResult InstanceRunner::Run(
    const proto::TaskSpec& task,
    const absl::optional<std::string>& prediction) {
  const std::string& id = task.instance_id();
  std::string dir = util::File::JoinPath(options_.output_dir, id);
  proto::InstanceResult result;
  result.set_instance_id(id);
  events_->InstanceStarted(id);
  Persist(util::File::JoinPath(dir, "task.json"), task);

  if (prediction) {
    result.set_patch(workspace::NormalizePatch(*prediction));
  } else if (model_ == nullptr) {
    SetError(util::InvalidInput("No model configured for " + id), &result);
  } else {
    Author(task, dir, &result);
  }
  try {
    util::File::Write(util::File::JoinPath(dir, "patch.diff"), result.patch());
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Cannot write the patch of " << id << ": " << exc.what();
  }

  if (Cancelled()) {
    LOG(WARNING) << id << ": cancelled, not grading";
    if (result.iteration().termination_reason() == proto::NOT_TERMINATED) {
      result.mutable_iteration()->set_termination_reason(proto::CANCELLED);
    }
    if (result.error_message().empty()) result.set_error_message("Cancelled");
    SetNotGraded(id, result.error_message(), result.mutable_report());
  } else if (!result.error_kind().empty()) {
    // The authoring phase did not finish, so there is no patch to grade.
    LOG(WARNING) << id << ": not grading, " << result.error_message();
    SetNotGraded(id, result.error_message(), result.mutable_report());
  } else {
    events_->Grading(id);
    grading::GradingOptions grading_options = options_.grading;
    grading_options.executor.workdir = Workdir(task);
    grading::GradingPipeline pipeline(provider_, grading_options);
    sandbox::StartOptions start;
    start.image = ImageName(options_.image_prefix, task);
    start.name = InstanceName(id, "grade");
    start.env.emplace_back("SWE_INSTANCE_ID", id);
    *result.mutable_report() = pipeline.Grade(
        task, start, result.patch(), util::File::JoinPath(dir, kGradingDir));
  }

  Persist(util::File::JoinPath(dir, "result.json"), result);
  events_->InstanceFinished(result);
  return result;
}

}  // namespace manager
