#include <atomic>
#include <csignal>
#include <map>
#include <memory>
#include <thread>

#include "absl/strings/str_split.h"
#include "absl/types/optional.h"
#include "agent/command_model.hpp"
#include "agent/retrying_model.hpp"
#include "core/core.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/event_queue.hpp"
#include "manager/instance_runner.hpp"
#include "manager/task_loader.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/json.hpp"
#include "util/status.hpp"

namespace {
const constexpr int kExitFailure = 1;
const constexpr int kExitInvalidInput = 2;
const constexpr char* kResultsFile = "results.jsonl";

std::atomic<bool> cancelled{false};
std::atomic<core::Core*> running_core{nullptr};

void HandleSignal(int /*signum*/) {
  cancelled = true;
  core::Core* core = running_core;
  if (core != nullptr) core->Stop();
}

absl::Status FillOptions(manager::RunnerOptions* options) {
  options->output_dir = FLAGS_output_dir;
  options->image_prefix = FLAGS_image_prefix;
  options->default_workdir = FLAGS_default_workdir;
  options->executor.preamble = FLAGS_env_preamble;
  options->executor.default_timeout_millis =
      FLAGS_command_timeout_seconds * 1000LL;
  if (FLAGS_write_chunk_bytes <= 0) {
    return util::InvalidInput("--write_chunk_bytes must be positive");
  }
  options->write_chunk_bytes = FLAGS_write_chunk_bytes;

  agent::AgentOptions& agent = options->agent;
  agent.max_iterations = FLAGS_max_iterations;
  agent.reset_interval = FLAGS_reset_interval;
  agent.parallel_read_only = FLAGS_parallel_read_only;
  std::vector<std::string> extensions =
      absl::StrSplit(FLAGS_source_extensions, ',', absl::SkipWhitespace());
  agent.source_extensions = std::move(extensions);
  if (!FLAGS_system_prompt_file.empty()) {
    try {
      agent.system_prompt = util::File::Read(FLAGS_system_prompt_file);
    } catch (const std::system_error& exc) {
      return util::InvalidInput("Cannot read --system_prompt_file: " +
                                std::string(exc.what()));
    }
  }
  agent.completion.set_model(FLAGS_model);
  agent.completion.set_temperature(FLAGS_temperature);
  agent.completion.set_max_tokens(FLAGS_max_tokens);
  agent.snapshot.char_ceiling = FLAGS_file_char_ceiling;
  if (agent.max_iterations <= 0) {
    return util::InvalidInput("--max_iterations must be positive");
  }

  grading::GradingOptions& grading = options->grading;
  grading.grade_empty_patch = FLAGS_grade_empty_patch;
  grading.fuzzy_apply_command = FLAGS_fuzzy_apply_command;
  grading.test_timeout_millis = FLAGS_test_timeout_seconds * 1000LL;
  grading.executor = options->executor;
  grading.temp_directory = FLAGS_temp_directory;
  return absl::OkStatus();
}

void LogEvent(const proto::Event& event) {
  switch (event.event_case()) {
    case proto::Event::kInstanceStarted:
      LOG(INFO) << "Started " << event.instance_started().instance_id();
      break;
    case proto::Event::kInstancePhase:
      VLOG(1) << event.instance_phase().instance_id() << ": "
              << proto::InstancePhase_Name(event.instance_phase().phase());
      break;
    case proto::Event::kInstanceFinished: {
      const proto::InstanceResult& result = event.instance_finished().result();
      LOG(INFO) << "Finished " << result.instance_id() << ": "
                << proto::GradingOutcome_Name(result.report().outcome())
                << " after " << result.iteration().iteration_count()
                << " steps"
                << (result.error_kind().empty()
                        ? ""
                        : " (" + result.error_kind() + ": " +
                              result.error_message() + ")");
      break;
    }
    case proto::Event::kFatalError:
      LOG(ERROR) << event.fatal_error().msg();
      break;
    case proto::Event::EVENT_NOT_SET:
      break;
  }
}

bool Unrecoverable(const proto::InstanceResult& result) {
  return result.error_kind() ==
             util::ErrorKindName(util::ErrorKind::kProvisioning) ||
         result.report().outcome() == proto::GRADING_ERROR;
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a code-fixing agent on a batch of tasks inside sandboxes and "
      "grades the patches it produces");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (FLAGS_tasks.empty()) {
    LOG(ERROR) << "--tasks is required";
    return kExitInvalidInput;
  }
  auto tasks = manager::LoadTasks(FLAGS_tasks);
  if (!tasks.ok()) {
    LOG(ERROR) << tasks.status();
    return kExitInvalidInput;
  }
  std::string results_path =
      util::File::JoinPath(FLAGS_output_dir, kResultsFile);
  manager::Selection selection;
  selection.instance_ids = FLAGS_instance_ids;
  selection.instance_range = FLAGS_instance_range;
  if (FLAGS_resume) selection.completed_results = results_path;
  auto selected = manager::SelectTasks(*tasks, selection);
  if (!selected.ok()) {
    LOG(ERROR) << selected.status();
    return kExitInvalidInput;
  }

  std::map<std::string, std::string> predictions;
  bool grade_only = !FLAGS_predictions.empty();
  if (grade_only) {
    auto loaded = manager::LoadPredictions(FLAGS_predictions);
    if (!loaded.ok()) {
      LOG(ERROR) << loaded.status();
      return kExitInvalidInput;
    }
    predictions = std::move(*loaded);
  } else if (FLAGS_model_command.empty()) {
    LOG(ERROR) << "Either --model_command or --predictions is required";
    return kExitInvalidInput;
  }

  manager::RunnerOptions options;
  absl::Status status = FillOptions(&options);
  if (!status.ok()) {
    LOG(ERROR) << status;
    return kExitInvalidInput;
  }

  sandbox::ProviderOptions provider_options;
  provider_options.temp_directory = FLAGS_temp_directory;
  provider_options.provision_timeout_millis =
      FLAGS_provision_timeout_seconds * 1000LL;
  provider_options.pull = FLAGS_docker_pull;
  std::unique_ptr<sandbox::IsolationProvider> provider =
      sandbox::IsolationProvider::Create(FLAGS_provider, provider_options);
  if (!provider) return kExitInvalidInput;

  std::unique_ptr<agent::ModelProvider> command_model;
  std::unique_ptr<agent::ModelProvider> model;
  if (!grade_only) {
    agent::CommandModelOptions model_options;
    model_options.command = FLAGS_model_command;
    model_options.timeout_millis = FLAGS_model_timeout_seconds * 1000LL;
    model_options.temp_directory = FLAGS_temp_directory;
    command_model.reset(new agent::CommandModelProvider(model_options));
    agent::RetryOptions retry;
    retry.max_attempts = FLAGS_model_max_attempts;
    retry.initial_backoff_millis = FLAGS_model_initial_backoff_millis;
    retry.max_backoff_millis = FLAGS_model_max_backoff_millis;
    model.reset(new agent::RetryingModelProvider(command_model.get(), retry));
  }

  manager::EventQueue queue;
  manager::InstanceRunner runner(provider.get(), model.get(), &queue,
                                 options, &cancelled);
  core::Core core;
  core.SetNumWorkers(FLAGS_num_workers);
  size_t scheduled = 0;
  for (const proto::TaskSpec& task : *selected) {
    absl::optional<std::string> prediction;
    if (grade_only) {
      auto it = predictions.find(task.instance_id());
      if (it == predictions.end()) {
        VLOG(1) << "No prediction for " << task.instance_id();
        continue;
      }
      prediction = it->second;
    }
    const std::string& id = task.instance_id();
    core.AddJob(
        "instance " + id,
        [&runner, task, prediction] { runner.Run(task, prediction); },
        [&queue, id](const core::TaskStatus& status) {
          // Instances that did not get to the end still need a result.
          if (status.event != core::TaskStatus::FAILURE &&
              status.event != core::TaskStatus::SKIPPED) {
            return true;
          }
          proto::InstanceResult result;
          result.set_instance_id(id);
          if (status.event == core::TaskStatus::SKIPPED) {
            result.mutable_iteration()->set_termination_reason(
                proto::CANCELLED);
            result.set_error_message("Cancelled");
          } else {
            result.set_error_kind(
                util::ErrorKindName(util::ErrorKind::kUnknown));
            result.set_error_message(status.message);
          }
          manager::SetNotGraded(id, result.error_message(),
                                result.mutable_report());
          queue.InstanceFinished(result);
          return true;
        });
    scheduled++;
  }
  LOG(INFO) << "Processing " << scheduled << " instances with "
            << FLAGS_num_workers << " workers";

  running_core = &core;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  bool core_ok = false;
  std::thread core_thread([&core, &queue, &core_ok] {
    try {
      core_ok = core.Run();
      if (!core_ok) queue.FatalError("The core failed");
    } catch (const std::exception& exc) {
      queue.FatalError(std::string("The core failed: ") + exc.what());
    }
    queue.Stop();
  });

  bool failed = false;
  while (absl::optional<proto::Event> event = queue.Dequeue()) {
    LogEvent(*event);
    if (event->has_fatal_error()) failed = true;
    if (!event->has_instance_finished()) continue;
    const proto::InstanceResult& result = event->instance_finished().result();
    if (Unrecoverable(result)) failed = true;
    absl::Status appended = util::AppendJsonLine(results_path, result);
    if (!appended.ok()) {
      LOG(ERROR) << "Cannot append to " << results_path << ": " << appended;
      failed = true;
    }
  }
  CHECK(queue.IsStopped()) << "Events drained before the core stopped";
  core_thread.join();
  running_core = nullptr;

  if (cancelled) {
    LOG(WARNING) << "Interrupted, the batch is incomplete";
    return kExitFailure;
  }
  return failed || !core_ok ? kExitFailure : 0;
}
