#include "workspace/view.hpp"

#include <algorithm>
#include <map>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "util/json.hpp"

namespace workspace {

namespace {
void AppendSection(std::string* out, const std::string& tag,
                   const std::string& body) {
  if (body.empty()) return;
  absl::StrAppend(out, "<", tag, ">\n", body, "\n</", tag, ">\n");
}

std::string Bullets(const google::protobuf::RepeatedPtrField<std::string>&
                        items) {
  std::string text;
  for (const std::string& item : items) {
    if (!text.empty()) text += "\n";
    absl::StrAppend(&text, "- ", item);
  }
  return text;
}
}  // namespace

void OpenFile(proto::WorkspaceView* view, const std::string& path) {
  CloseFile(view, path);
  auto* files = view->mutable_open_files();
  files->Add(std::string(path));
  std::rotate(files->begin(), files->end() - 1, files->end());
}

bool CloseFile(proto::WorkspaceView* view, const std::string& path) {
  auto* files = view->mutable_open_files();
  auto it = std::find(files->begin(), files->end(), path);
  if (it == files->end()) return false;
  files->erase(it);
  return true;
}

void OpenDirectory(proto::WorkspaceView* view, const std::string& path,
                   int32_t depth) {
  (*view->mutable_open_directories())[path] = std::max(depth, 1);
}

bool CloseDirectory(proto::WorkspaceView* view, const std::string& path) {
  return view->mutable_open_directories()->erase(path) > 0;
}

void RecordCommand(proto::WorkspaceView* view, const std::string& command,
                   const proto::CommandResult& result) {
  proto::TerminalEntry* entry = view->add_terminal_session();
  entry->set_command(command);
  *entry->mutable_result() = result;
}

void UpdateReport(proto::WorkspaceView* view,
                  const proto::WorkspaceReport& update) {
  proto::WorkspaceReport* report = view->mutable_report();
  if (update.checklist_size()) *report->mutable_checklist() = update.checklist();
  if (!update.issue_analysis().empty())
    report->set_issue_analysis(update.issue_analysis());
  if (update.detail_logs_size())
    *report->mutable_detail_logs() = update.detail_logs();
  if (update.proposed_solutions_size())
    *report->mutable_proposed_solutions() = update.proposed_solutions();
  if (!update.next_steps().empty()) report->set_next_steps(update.next_steps());
  if (update.test_commands_size())
    *report->mutable_test_commands() = update.test_commands();
}

std::string FormatReport(const proto::WorkspaceView& view) {
  const proto::WorkspaceReport& report = view.report();
  std::map<std::string, int32_t> folders(view.open_directories().begin(),
                                         view.open_directories().end());
  std::string folder_text;
  for (const auto& folder : folders) {
    if (!folder_text.empty()) folder_text += "\n";
    absl::StrAppend(&folder_text, "- ", folder.first, " (depth ",
                    folder.second, ")");
  }
  std::string out;
  AppendSection(&out, "open_folders", folder_text);
  AppendSection(&out, "open_files_in_code_editor",
                Bullets(view.open_files()));
  AppendSection(&out, "checklist_of_tasks", Bullets(report.checklist()));
  AppendSection(&out, "issue_analysis", report.issue_analysis());
  AppendSection(&out, "detail_logs", Bullets(report.detail_logs()));
  AppendSection(&out, "proposed_solutions",
                Bullets(report.proposed_solutions()));
  AppendSection(&out, "next_steps", report.next_steps());
  AppendSection(&out, "test_commands", Bullets(report.test_commands()));
  return out;
}

absl::Status SaveView(const proto::WorkspaceView& view,
                      const std::string& path) {
  return util::WriteJsonFile(path, view);
}

absl::Status LoadView(const std::string& path, proto::WorkspaceView* view) {
  return util::ReadJsonFile(path, view);
}

}  // namespace workspace
