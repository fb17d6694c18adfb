#include "agent/tools.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "proto/tools.pb.h"
#include "util/json.hpp"
#include "util/misc.hpp"
#include "util/status.hpp"
#include "workspace/snapshot.hpp"
#include "workspace/view.hpp"

namespace agent {

namespace {
const char* const kBashSchema = R"({
  "type": "object",
  "properties": {
    "command": {"type": "string", "description": "Shell command to run."},
    "timeout_seconds": {"type": "integer", "description": "Optional timeout."}
  },
  "required": ["command"]
})";

const char* const kEditFileSchema = R"({
  "type": "object",
  "properties": {
    "command": {
      "type": "string",
      "enum": ["create", "str_replace", "insert", "undo_edit", "reset"]
    },
    "path": {"type": "string"},
    "file_text": {"type": "string", "description": "Content for create."},
    "old_str": {"type": "string", "description": "Exact text to replace."},
    "new_str": {"type": "string", "description": "Replacement or inserted text."},
    "insert_line": {"type": "integer", "description": "1-based line for insert."},
    "overwrite": {"type": "boolean", "description": "Let create replace a file."}
  },
  "required": ["command", "path"]
})";

const char* const kViewFileSchema = R"({
  "type": "object",
  "properties": {
    "path": {"type": "string"},
    "view_range": {
      "type": "array",
      "items": {"type": "integer"},
      "description": "Optional [start, end] lines, 1-based; end -1 means the last line."
    }
  },
  "required": ["path"]
})";

const char* const kPathsSchema = R"({
  "type": "object",
  "properties": {
    "paths": {"type": "array", "items": {"type": "string"}}
  },
  "required": ["paths"]
})";

const char* const kFolderSchema = R"({
  "type": "object",
  "properties": {
    "path": {"type": "string"},
    "depth": {"type": "integer", "description": "Levels listed, default 1."}
  },
  "required": ["path"]
})";

const char* const kReportSchema = R"({
  "type": "object",
  "properties": {
    "report": {
      "type": "object",
      "properties": {
        "checklist": {"type": "array", "items": {"type": "string"}},
        "issue_analysis": {"type": "string"},
        "detail_logs": {"type": "array", "items": {"type": "string"}},
        "proposed_solutions": {"type": "array", "items": {"type": "string"}},
        "next_steps": {"type": "string"},
        "test_commands": {"type": "array", "items": {"type": "string"}}
      }
    }
  },
  "required": ["report"]
})";

const char* const kSubmitSchema = R"({
  "type": "object",
  "properties": {
    "summary": {"type": "string", "description": "What was changed and why."}
  }
})";

ToolOutcome Success(std::string content) {
  ToolOutcome outcome;
  outcome.content = std::move(content);
  return outcome;
}

ToolOutcome Failure(std::string content) {
  ToolOutcome outcome;
  outcome.content = std::move(content);
  outcome.success = false;
  return outcome;
}

// Failed tool operations go back to the model, except when the instance
// itself is gone.
absl::StatusOr<ToolOutcome> FromStatus(const absl::Status& status,
                                       std::string on_success) {
  if (status.ok()) return Success(std::move(on_success));
  if (util::GetErrorKind(status) == util::ErrorKind::kProvisioning) {
    return status;
  }
  return Failure(absl::StrCat("Error: ", status.message()));
}

template <typename T>
absl::Status ParseArgs(const std::string& json, T* args) {
  return util::FromJson(json.empty() ? "{}" : json, args);
}

ToolOutcome InvalidArguments(const absl::Status& status) {
  return Failure(absl::StrCat("Invalid arguments: ", status.message()));
}

absl::StatusOr<bool> TestPath(executor::CommandExecutor* executor,
                              const char* flag, const std::string& path) {
  absl::StatusOr<proto::CommandResult> result = executor->ExecuteRaw(
      absl::StrCat("test ", flag, " ", util::ShellQuote(path)));
  if (!result.ok()) return result.status();
  return !result->timed_out() && result->exit_code() == 0;
}
}  // namespace

const std::vector<ToolSpec>& ToolSpecs() {
  static const std::vector<ToolSpec> specs = {
      {ToolKind::kBash, "bash",
       "Runs a shell command in the repository and returns its output.",
       kBashSchema, false, false},
      {ToolKind::kEditFile, "edit_file",
       "Creates a file, replaces a unique piece of text, inserts text at a "
       "line, undoes the last edit of a file or resets it to the original "
       "version.",
       kEditFileSchema, false, false},
      {ToolKind::kViewFile, "view_file",
       "Shows a file, or a range of its lines, with line numbers.",
       kViewFileSchema, true, false},
      {ToolKind::kOpenFile, "open_file",
       "Keeps files visible in the workspace at every step.", kPathsSchema,
       false, false},
      {ToolKind::kCloseFile, "close_file",
       "Removes files from the workspace.", kPathsSchema, false, false},
      {ToolKind::kOpenFolder, "open_folder",
       "Keeps the listing of a folder visible in the workspace.",
       kFolderSchema, false, false},
      {ToolKind::kCloseFolder, "close_folder",
       "Removes a folder listing from the workspace.", kFolderSchema, false,
       false},
      {ToolKind::kReport, "report",
       "Updates the notes kept when the conversation is reset: checklist, "
       "analysis, logs, proposed solutions, next steps and test commands.",
       kReportSchema, false, false},
      {ToolKind::kSubmit, "submit",
       "Declares the work finished. The current changes are the solution.",
       kSubmitSchema, false, true},
  };
  return specs;
}

const ToolSpec* FindTool(const std::string& name) {
  for (const ToolSpec& spec : ToolSpecs()) {
    if (name == spec.name) return &spec;
  }
  return nullptr;
}

std::vector<proto::ToolDescriptor> ToolDescriptors() {
  std::vector<proto::ToolDescriptor> descriptors;
  for (const ToolSpec& spec : ToolSpecs()) {
    proto::ToolDescriptor descriptor;
    descriptor.set_name(spec.name);
    descriptor.set_description(spec.description);
    descriptor.set_parameters_json(spec.parameters_json);
    descriptors.push_back(std::move(descriptor));
  }
  return descriptors;
}

absl::StatusOr<ToolOutcome> ToolDispatcher::Dispatch(
    const proto::ToolInvocation& invocation) {
  const ToolSpec* spec = FindTool(invocation.name());
  if (spec == nullptr) {
    return Failure(absl::StrCat("Unknown tool: ", invocation.name()));
  }
  VLOG(1) << "Tool " << invocation.name() << " " << invocation.arguments_json();
  absl::StatusOr<ToolOutcome> outcome =
      Invoke(spec->kind, invocation.arguments_json());
  if (outcome.ok()) outcome->content = util::SanitizeUtf8(outcome->content);
  return outcome;
}

absl::StatusOr<ToolOutcome> ToolDispatcher::Invoke(
    ToolKind kind, const std::string& arguments) {
  switch (kind) {
    case ToolKind::kBash:
      return Bash(arguments);
    case ToolKind::kEditFile:
      return EditFile(arguments);
    case ToolKind::kViewFile:
      return ViewFile(arguments);
    case ToolKind::kOpenFile:
      return OpenFiles(arguments);
    case ToolKind::kCloseFile:
      return CloseFiles(arguments);
    case ToolKind::kOpenFolder:
      return OpenFolder(arguments);
    case ToolKind::kCloseFolder:
      return CloseFolder(arguments);
    case ToolKind::kReport:
      return Report(arguments);
    case ToolKind::kSubmit:
      return Submit(arguments);
  }
  LOG(FATAL) << "Unhandled tool kind " << static_cast<int>(kind);
  return Failure("unreachable");
}

absl::StatusOr<ToolOutcome> ToolDispatcher::Bash(const std::string& arguments) {
  proto::BashArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  if (args.command().empty()) return Failure("Error: the command is empty");
  if (args.timeout_seconds() < 0) {
    return Failure("Error: the timeout must not be negative");
  }
  absl::StatusOr<proto::CommandResult> result =
      executor_->Execute(args.command(), args.timeout_seconds() * 1000LL);
  if (!result.ok()) return FromStatus(result.status(), "");
  workspace::RecordCommand(view_, args.command(), *result);
  ToolOutcome outcome = Success(executor::FormatResult(*result));
  outcome.success = result->exit_code() == 0 && !result->timed_out();
  return outcome;
}

absl::StatusOr<ToolOutcome> ToolDispatcher::EditFile(
    const std::string& arguments) {
  proto::EditFileArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  const std::string& path = args.path();
  absl::Status status;
  std::string done;
  bool open = true;
  if (args.command() == "create") {
    status = store_->Create(path, args.file_text(), args.overwrite());
    done = absl::StrCat("File created at ", path, ".");
  } else if (args.command() == "str_replace") {
    status = store_->Replace(path, args.old_str(), args.new_str());
    done = absl::StrCat("The text in ", path, " was replaced.");
  } else if (args.command() == "insert") {
    status = store_->Insert(path, args.insert_line(), args.new_str());
    done = absl::StrCat("Text inserted at line ", args.insert_line(), " of ",
                        path, ".");
  } else if (args.command() == "undo_edit") {
    status = store_->Undo(path);
    done = absl::StrCat("Last edit of ", path, " undone.");
  } else if (args.command() == "reset") {
    status = store_->Reset(path);
    done = absl::StrCat(path, " restored to its original version.");
    open = false;
  } else {
    return Failure(
        absl::StrCat("Error: unknown edit_file command '", args.command(),
                     "'; use create, str_replace, insert, undo_edit or "
                     "reset"));
  }
  if (status.ok() && open) workspace::OpenFile(view_, path);
  return FromStatus(status, done);
}

absl::StatusOr<ToolOutcome> ToolDispatcher::ViewFile(
    const std::string& arguments) {
  proto::ViewFileArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  absl::StatusOr<std::string> content = store_->Read(args.path());
  if (!content.ok()) return FromStatus(content.status(), "");
  std::vector<std::string> lines = util::SplitLines(*content);
  int64_t count = lines.size();
  int64_t first = 1;
  int64_t last = count;
  if (args.view_range_size() != 0) {
    if (args.view_range_size() != 2) {
      return Failure("Error: view_range must be [start, end]");
    }
    first = args.view_range(0);
    last = args.view_range(1) == -1 ? count : args.view_range(1);
    if (first < 1 || last < first || last > count) {
      return Failure(absl::StrCat("Error: invalid view_range [",
                                  args.view_range(0), ", ",
                                  args.view_range(1), "], ", args.path(),
                                  " has ", count, " lines"));
    }
  }
  if (count == 0) return Success(absl::StrCat(args.path(), " is empty."));
  std::string selected =
      absl::StrJoin(lines.begin() + first - 1, lines.begin() + last, "\n");
  return Success(workspace::Truncate(util::NumberLines(selected, first),
                                     options_.view_char_ceiling));
}

absl::StatusOr<ToolOutcome> ToolDispatcher::OpenFiles(
    const std::string& arguments) {
  proto::PathsArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  if (args.paths_size() == 0) return Failure("Error: no paths given");
  std::vector<std::string> opened;
  std::vector<std::string> missing;
  for (const std::string& path : args.paths()) {
    absl::StatusOr<bool> exists = TestPath(executor_, "-f", path);
    if (!exists.ok()) return FromStatus(exists.status(), "");
    if (*exists) {
      workspace::OpenFile(view_, path);
      opened.push_back(path);
    } else {
      missing.push_back(path);
    }
  }
  std::string text;
  if (!opened.empty()) {
    absl::StrAppend(&text, "Opened ", absl::StrJoin(opened, ", "), ".");
  }
  if (!missing.empty()) {
    if (!text.empty()) text += "\n";
    absl::StrAppend(&text, "Error: no such file: ",
                    absl::StrJoin(missing, ", "));
  }
  ToolOutcome outcome = Success(text);
  outcome.success = missing.empty();
  return outcome;
}

absl::StatusOr<ToolOutcome> ToolDispatcher::CloseFiles(
    const std::string& arguments) {
  proto::PathsArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  std::vector<std::string> unknown;
  for (const std::string& path : args.paths()) {
    if (!workspace::CloseFile(view_, path)) unknown.push_back(path);
  }
  if (!unknown.empty()) {
    return Failure(
        absl::StrCat("Error: not open: ", absl::StrJoin(unknown, ", ")));
  }
  return Success("Closed.");
}

absl::StatusOr<ToolOutcome> ToolDispatcher::OpenFolder(
    const std::string& arguments) {
  proto::FolderArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  if (args.depth() < 0) return Failure("Error: the depth must be positive");
  std::string path = args.path().empty() ? "." : args.path();
  absl::StatusOr<bool> exists = TestPath(executor_, "-d", path);
  if (!exists.ok()) return FromStatus(exists.status(), "");
  if (!*exists) return Failure(absl::StrCat("Error: no such folder: ", path));
  int32_t depth = args.depth() == 0 ? 1 : args.depth();
  workspace::OpenDirectory(view_, path, depth);
  return Success(absl::StrCat("Opened ", path, " with depth ", depth, "."));
}

absl::StatusOr<ToolOutcome> ToolDispatcher::CloseFolder(
    const std::string& arguments) {
  proto::FolderArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  if (!workspace::CloseDirectory(view_, args.path())) {
    return Failure(absl::StrCat("Error: not open: ", args.path()));
  }
  return Success("Closed.");
}

absl::StatusOr<ToolOutcome> ToolDispatcher::Report(
    const std::string& arguments) {
  proto::ReportArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  workspace::UpdateReport(view_, args.report());
  return Success("Report updated.");
}

absl::StatusOr<ToolOutcome> ToolDispatcher::Submit(
    const std::string& arguments) {
  proto::SubmitArgs args;
  absl::Status parsed = ParseArgs(arguments, &args);
  if (!parsed.ok()) return InvalidArguments(parsed);
  ToolOutcome outcome = Success("Submitted.");
  outcome.terminate = true;
  return outcome;
}

}  // namespace agent
