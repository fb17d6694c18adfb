#include "grading/test_log_parser.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace grading {

namespace {
TestLogParser::Register<PytestParser> pytest_register("pytest");
TestLogParser::Register<DjangoParser> django_register("django");
TestLogParser::Register<ExitCodeParser> exitcode_register("exitcode");

// Statuses of a pytest run. Skipped tests are left out.
bool PytestStatus(absl::string_view word, proto::TestStatus* status) {
  if (word == "PASSED" || word == "XFAIL") {
    *status = proto::PASS;
    return true;
  }
  if (word == "FAILED" || word == "ERROR" || word == "XPASS") {
    *status = proto::FAIL;
    return true;
  }
  return false;
}
}  // namespace

TestLogParser::store_t* TestLogParser::Parsers_() {
  static store_t* parsers = new store_t;
  return parsers;
}

void TestLogParser::Register_(const std::string& grammar, create_t create) {
  CHECK(Parsers_()->emplace(grammar, std::move(create)).second)
      << "Test log parser " << grammar << " registered twice";
}

std::unique_ptr<TestLogParser> TestLogParser::Create(
    const std::string& grammar) {
  auto it = Parsers_()->find(grammar);
  if (it == Parsers_()->end()) return nullptr;
  return std::unique_ptr<TestLogParser>(it->second());
}

std::vector<std::string> TestLogParser::Names() {
  std::vector<std::string> names;
  for (const auto& parser : *Parsers_()) names.push_back(parser.first);
  return names;
}

TestStatusMap PytestParser::Parse(const std::string& output) const {
  TestStatusMap tests;
  for (absl::string_view line : absl::StrSplit(output, '\n')) {
    std::vector<absl::string_view> words =
        absl::StrSplit(line, absl::ByAnyChar(" \t\r"), absl::SkipEmpty());
    if (words.size() < 2) continue;
    proto::TestStatus status;
    if (PytestStatus(words[0], &status)) {
      // The short summary appends " - <reason>" to failures.
      tests[std::string(words[1])] = status;
    } else if (absl::StrContains(words[0], "::") &&
               PytestStatus(words[1], &status)) {
      tests[std::string(words[0])] = status;
    }
  }
  return tests;
}

TestStatusMap DjangoParser::Parse(const std::string& output) const {
  TestStatusMap tests;
  for (absl::string_view line : absl::StrSplit(output, '\n')) {
    size_t dots = line.find(" ... ");
    if (dots == absl::string_view::npos) continue;
    std::string name(absl::StripAsciiWhitespace(line.substr(0, dots)));
    absl::string_view result =
        absl::StripAsciiWhitespace(line.substr(dots + 5));
    if (name.empty()) continue;
    if (result == "ok" || result == "expected failure") {
      tests[name] = proto::PASS;
    } else if (absl::StartsWith(result, "FAIL") ||
               absl::StartsWith(result, "ERROR") ||
               result == "unexpected success") {
      tests[name] = proto::FAIL;
    }
  }
  return tests;
}

}  // namespace grading
