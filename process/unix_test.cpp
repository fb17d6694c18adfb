#include "process/runner.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::StartsWith;

using namespace process;

const std::string test_tmpdir = "/tmp/fixbench_testdir";

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/fixbench/does/not/exist", "/bin/true");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(runner->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/", "/fixbench/does/not/exist");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(runner->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnCode) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/", "/bin/sh");
  options.args = {"-c", "exit 15"};
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.timed_out);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignal) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/", "/bin/sh");
  options.args = {"-c", "kill -6 $$"};
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestRedirection) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/stdin", "from stdin");
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options(tmp.Path(), "/bin/sh");
  options.args = {"-c", "cat; echo oops >&2; pwd > where"};
  options.stdin_file = tmp.Path() + "/stdin";
  options.stdout_file = tmp.Path() + "/stdout";
  options.stderr_file = tmp.Path() + "/stderr";
  ExecutionInfo info;
  std::string error_msg;
  ASSERT_TRUE(runner->Execute(options, &info, &error_msg)) << error_msg;
  EXPECT_EQ(util::File::Read(tmp.Path() + "/stdout"), "from stdin");
  EXPECT_EQ(util::File::Read(tmp.Path() + "/stderr"), "oops\n");
  EXPECT_EQ(util::File::Read(tmp.Path() + "/where"), tmp.Path() + "\n");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/", "/bin/sleep");
  options.args.push_back("0.1");
  options.wall_limit_millis = 2000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.timed_out);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/", "/bin/sleep");
  options.args.push_back("10");
  options.wall_limit_millis = 100;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 9);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_TRUE(info.timed_out);
  EXPECT_GE(info.wall_time_millis, 100);
  EXPECT_LE(info.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitKillsGrandchildren) {
  util::TempDir tmp(test_tmpdir);
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options(tmp.Path(), "/bin/sh");
  options.args = {"-c", "sleep 30; echo late > late"};
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  EXPECT_LE(info.wall_time_millis, 2000);
  EXPECT_FALSE(util::File::Exists(tmp.Path() + "/late"));
}

}  // namespace
