#include "agent/agent_loop.hpp"

#include <algorithm>
#include <future>
#include <map>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/status.hpp"
#include "workspace/view.hpp"

namespace agent {

const char* const kDefaultSystemPrompt =
    "You are fixing an issue in the repository checked out in the current "
    "directory. Every turn shows the open folders, the open files, the "
    "changes made so far and the output of your last commands. Use the "
    "tools to investigate, edit the code and run the tests. Keep the report "
    "up to date: the conversation is periodically reset and the report is "
    "all that survives. Call submit once the issue is fixed.";

namespace {
const char* const kSkippedFolders[] = {"tests", "test",  "docs", "doc",
                                       "examples", "build", "dist"};

const char* const kInitialChecklist[] = {
    "Reproduce the issue",
    "Locate the code responsible",
    "Fix the issue",
    "Verify the fix and check for regressions",
};

proto::Message MakeMessage(proto::Role role, std::string content) {
  proto::Message message;
  message.set_role(role);
  message.set_content(std::move(content));
  return message;
}
}  // namespace

AgentLoop::AgentLoop(ModelProvider* model, executor::CommandExecutor* executor,
                     workspace::FileMutationStore* store,
                     workspace::PatchExtractor* extractor,
                     AgentOptions options, const std::atomic<bool>* cancelled)
    : model_(model),
      executor_(executor),
      options_(std::move(options)),
      cancelled_(cancelled),
      snapshot_(executor, store, extractor, options_.snapshot),
      dispatcher_(executor, store, &view_,
                  DispatcherOptions{options_.snapshot.char_ceiling}),
      conversation_(options_.history_path),
      tools_(ToolDescriptors()) {}

absl::StatusOr<std::string> AgentLoop::DetectSourceFolder() {
  absl::StatusOr<proto::CommandResult> result = executor_->ExecuteRaw(
      "find . -mindepth 1 -name '.*' -prune -o -type f -print");
  if (!result.ok()) return result.status();
  std::map<std::string, int64_t> counts;
  for (absl::string_view line :
       absl::StrSplit(result->stdout(), '\n', absl::SkipEmpty())) {
    if (absl::StartsWith(line, "./")) line.remove_prefix(2);
    size_t slash = line.find('/');
    if (slash == absl::string_view::npos) continue;
    std::string folder(line.substr(0, slash));
    if (folder[0] == '.' ||
        std::find(std::begin(kSkippedFolders), std::end(kSkippedFolders),
                  folder) != std::end(kSkippedFolders)) {
      continue;
    }
    size_t dot = line.rfind('.');
    if (dot == absl::string_view::npos || dot < slash) continue;
    std::string extension(line.substr(dot + 1));
    if (std::find(options_.source_extensions.begin(),
                  options_.source_extensions.end(),
                  extension) != options_.source_extensions.end()) {
      counts[folder]++;
    }
  }
  std::string best;
  int64_t best_count = 0;
  for (const auto& count : counts) {
    if (count.second > best_count) {
      best = count.first;
      best_count = count.second;
    }
  }
  return best;
}

void AgentLoop::SeedConversation() {
  if (!options_.system_prompt.empty()) {
    conversation_.Append(MakeMessage(proto::SYSTEM, options_.system_prompt));
  }
  conversation_.Append(MakeMessage(
      proto::USER, absl::StrCat("<issue>\n", problem_statement_, "\n</issue>")));
}

void AgentLoop::Checkpoint() {
  if (options_.view_path.empty()) return;
  absl::Status status = workspace::SaveView(view_, options_.view_path);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot save the workspace to " << options_.view_path
               << ": " << status;
  }
}

absl::Status AgentLoop::Init() {
  workspace::OpenDirectory(&view_, ".", 1);
  absl::StatusOr<std::string> source = DetectSourceFolder();
  if (!source.ok()) return source.status();
  if (!source->empty()) {
    LOG(INFO) << "Main source folder of " << executor_->instance().name
              << " is " << *source;
    workspace::OpenDirectory(&view_, *source, 2);
  }
  for (const char* item : kInitialChecklist) {
    view_.mutable_report()->add_checklist(item);
  }
  SeedConversation();
  Checkpoint();
  return absl::OkStatus();
}

absl::StatusOr<std::vector<ToolOutcome>> AgentLoop::DispatchBatch(
    const proto::Message& message) {
  const auto& invocations = message.tool_invocations();
  bool read_only = invocations.size() > 1 && options_.parallel_read_only;
  for (const proto::ToolInvocation& invocation : invocations) {
    const ToolSpec* spec = FindTool(invocation.name());
    if (spec == nullptr || !spec->read_only) read_only = false;
  }

  std::vector<absl::StatusOr<ToolOutcome>> results;
  if (read_only) {
    std::vector<std::future<absl::StatusOr<ToolOutcome>>> futures;
    for (const proto::ToolInvocation& invocation : invocations) {
      futures.push_back(std::async(std::launch::async, [this, &invocation]() {
        return dispatcher_.Dispatch(invocation);
      }));
    }
    for (auto& future : futures) results.push_back(future.get());
  } else {
    for (const proto::ToolInvocation& invocation : invocations) {
      results.push_back(dispatcher_.Dispatch(invocation));
      if (!results.back().ok()) break;
    }
  }

  std::vector<ToolOutcome> outcomes;
  for (auto& result : results) {
    if (!result.ok()) return result.status();
    outcomes.push_back(std::move(*result));
  }
  return outcomes;
}

absl::Status AgentLoop::Step(bool* terminate) {
  absl::StatusOr<std::string> snapshot = snapshot_.Render(&view_);
  if (!snapshot.ok()) return snapshot.status();
  std::vector<proto::Message> request = conversation_.window();
  request.push_back(MakeMessage(
      proto::USER, absl::StrCat("<workspace>\n", *snapshot, "</workspace>")));

  absl::StatusOr<proto::Message> reply =
      model_->Complete(request, tools_, options_.completion);
  if (!reply.ok()) return reply.status();
  reply->set_role(proto::ASSISTANT);
  conversation_.Append(*reply);

  absl::StatusOr<std::vector<ToolOutcome>> outcomes = DispatchBatch(*reply);
  if (!outcomes.ok()) return outcomes.status();
  for (int i = 0; i < reply->tool_invocations_size(); i++) {
    const proto::ToolInvocation& invocation = reply->tool_invocations(i);
    const ToolOutcome& outcome = (*outcomes)[i];
    proto::Message message = MakeMessage(proto::TOOL, outcome.content);
    message.set_tool_invocation_id(invocation.id());
    message.set_tool_name(invocation.name());
    conversation_.Append(std::move(message));
    if (outcome.terminate) *terminate = true;
  }
  if (reply->tool_invocations_size() == 0) {
    conversation_.Append(MakeMessage(
        proto::USER,
        "No tool was called. Continue with the tools, or call submit when "
        "the issue is fixed."));
  }
  iteration_.set_iteration_count(iteration_.iteration_count() + 1);
  Checkpoint();
  return absl::OkStatus();
}

absl::Status AgentLoop::ResetContext() {
  state_ = State::kResetting;
  LOG(INFO) << "Resetting the context of " << executor_->instance().name
            << " after " << iteration_.iteration_count() << " steps";
  std::string tests;
  for (const std::string& command : view_.report().test_commands()) {
    absl::StatusOr<proto::CommandResult> result = executor_->Execute(command);
    if (!result.ok()) return result.status();
    workspace::RecordCommand(&view_, command, *result);
    absl::StrAppend(&tests, "$ ", command, "\n",
                    executor::FormatResult(*result), "\n");
  }
  conversation_.Reset(
      absl::StrCat("reset after step ", iteration_.iteration_count()));
  SeedConversation();
  std::string content = absl::StrCat(
      "The conversation was reset to save space. These are your notes "
      "so far:\n",
      workspace::FormatReport(view_));
  if (!tests.empty()) {
    absl::StrAppend(&content, "<test_results>\n", tests, "</test_results>\n");
  }
  conversation_.Append(MakeMessage(proto::USER, content));
  iteration_.set_reset_cycle_count(iteration_.reset_cycle_count() + 1);
  state_ = State::kRunning;
  return absl::OkStatus();
}

absl::StatusOr<proto::IterationState> AgentLoop::Run(
    const std::string& problem_statement) {
  CHECK(state_ == State::kInit) << "AgentLoop::Run called twice";
  problem_statement_ = problem_statement;
  absl::Status status = Init();
  state_ = State::kRunning;
  while (status.ok()) {
    if (Cancelled()) {
      iteration_.set_termination_reason(proto::CANCELLED);
      break;
    }
    if (iteration_.iteration_count() >= options_.max_iterations) {
      iteration_.set_termination_reason(proto::MAX_ITERATIONS);
      break;
    }
    if (options_.reset_interval > 0 && iteration_.iteration_count() > 0 &&
        iteration_.iteration_count() % options_.reset_interval == 0) {
      status = ResetContext();
      if (!status.ok()) break;
    }
    bool terminate = false;
    status = Step(&terminate);
    if (status.ok() && terminate) {
      iteration_.set_termination_reason(proto::TOOL_TERMINATE);
      break;
    }
  }
  state_ = State::kTerminated;
  Checkpoint();
  if (!status.ok()) {
    LOG(WARNING) << "Agent on " << executor_->instance().name
                 << " stopped after " << iteration_.iteration_count()
                 << " steps: " << status;
    return status;
  }
  LOG(INFO) << "Agent on " << executor_->instance().name << " finished after "
            << iteration_.iteration_count() << " steps: "
            << proto::TerminationReason_Name(iteration_.termination_reason());
  return iteration_;
}

}  // namespace agent
