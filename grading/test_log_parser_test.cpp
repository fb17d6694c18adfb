#include "grading/test_log_parser.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

// NOLINTNEXTLINE
TEST(TestLogParserTest, Registry) {
  EXPECT_THAT(grading::TestLogParser::Names(),
              ElementsAre("django", "exitcode", "pytest"));
  EXPECT_EQ(grading::TestLogParser::Create("junit"), nullptr);
}

// NOLINTNEXTLINE
TEST(TestLogParserTest, PytestSummaryAndVerboseLines) {
  auto parser = grading::TestLogParser::Create("pytest");
  ASSERT_NE(parser, nullptr);
  std::string output =
      "============ test session starts ============\n"
      "tests/test_calc.py::test_add PASSED                 [ 33%]\n"
      "tests/test_calc.py::test_sub FAILED                 [ 66%]\n"
      "tests/test_calc.py::test_div SKIPPED (no numpy)     [100%]\n"
      "=========== short test summary info ===========\n"
      "PASSED tests/test_calc.py::test_mul\n"
      "FAILED tests/test_calc.py::test_sub - AssertionError: 1 != 3\n"
      "ERROR tests/test_io.py::test_read\r\n"
      "XFAIL tests/test_calc.py::test_pow\n"
      "====== 1 failed, 2 passed in 0.12s ======\n";
  EXPECT_THAT(
      parser->Parse(output),
      ElementsAre(Pair("tests/test_calc.py::test_add", proto::PASS),
                  Pair("tests/test_calc.py::test_mul", proto::PASS),
                  Pair("tests/test_calc.py::test_pow", proto::PASS),
                  Pair("tests/test_calc.py::test_sub", proto::FAIL),
                  Pair("tests/test_io.py::test_read", proto::FAIL)));
}

// NOLINTNEXTLINE
TEST(TestLogParserTest, PytestLastStatusWins) {
  grading::PytestParser parser;
  EXPECT_THAT(parser.Parse("FAILED t.py::a\nPASSED t.py::a\n"),
              ElementsAre(Pair("t.py::a", proto::PASS)));
}

// NOLINTNEXTLINE
TEST(TestLogParserTest, Django) {
  grading::DjangoParser parser;
  std::string output =
      "test_create (admin.tests.UserTests) ... ok\n"
      "test_delete (admin.tests.UserTests) ... FAIL\n"
      "test_edit (admin.tests.UserTests) ... ERROR\n"
      "test_old (admin.tests.UserTests) ... skipped 'obsolete'\n"
      "test_known (admin.tests.UserTests) ... expected failure\n"
      "Ran 5 tests in 0.010s\n";
  EXPECT_THAT(
      parser.Parse(output),
      ElementsAre(Pair("test_create (admin.tests.UserTests)", proto::PASS),
                  Pair("test_delete (admin.tests.UserTests)", proto::FAIL),
                  Pair("test_edit (admin.tests.UserTests)", proto::FAIL),
                  Pair("test_known (admin.tests.UserTests)", proto::PASS)));
}

// NOLINTNEXTLINE
TEST(TestLogParserTest, ExitCodeReportsNothing) {
  grading::ExitCodeParser parser;
  EXPECT_THAT(parser.Parse("PASSED t.py::a\n"), IsEmpty());
  EXPECT_FALSE(parser.ReportsTests());
  EXPECT_TRUE(grading::PytestParser().ReportsTests());
}

}  // namespace
