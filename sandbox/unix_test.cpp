#include "sandbox/unix.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/patchbench_testdir";

ProcessOptions Shell(const std::string& script) {
  ProcessOptions options;
  options.argv = {"/bin/sh", "-c", script};
  return options;
}

std::string StartError(const ProcessOptions& options) {
  UnixSandbox sandbox;
  try {
    sandbox.Run(options);
  } catch (const std::runtime_error& exc) {
    return exc.what();
  }
  return "";
}

// NOLINTNEXTLINE
TEST(UnixSandbox, MissingWorkdir) {
  ProcessOptions options = Shell("true");
  options.workdir = "/does/not/exist";
  EXPECT_THAT(StartError(options), StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixSandbox, MissingExecutable) {
  ProcessOptions options;
  options.argv = {"/does/not/exist"};
  EXPECT_THAT(StartError(options), StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixSandbox, MissingStdin) {
  ProcessOptions options = Shell("cat");
  options.stdin_file = "/does/not/exist";
  EXPECT_THAT(StartError(options), StartsWith("open:"));
}

// NOLINTNEXTLINE
TEST(UnixSandbox, ExitCode) {
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(Shell("exit 15"));
  EXPECT_EQ(status.exit_code, 15);
  EXPECT_EQ(status.signal, 0);
  EXPECT_FALSE(status.timed_out);
  EXPECT_FALSE(status.cancelled);
}

// NOLINTNEXTLINE
TEST(UnixSandbox, Signal) {
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(Shell("kill -6 $$"));
  EXPECT_EQ(status.signal, 6);
  EXPECT_EQ(status.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixSandbox, RedirectionAndEnvironment) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/in", "from stdin");
  ProcessOptions options =
      Shell("cat; echo \" $GREETING $(pwd)\"; echo err >&2");
  options.workdir = tmp.Path();
  options.env.push_back("GREETING=hello");
  options.stdin_file = tmp.Path() + "/in";
  options.stdout_file = tmp.Path() + "/out";
  options.stderr_file = tmp.Path() + "/err";
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(options);
  EXPECT_EQ(status.exit_code, 0);
  EXPECT_EQ(util::File::ReadAll(tmp.Path() + "/out"),
            "from stdin hello " + tmp.Path() + "\n");
  EXPECT_EQ(util::File::ReadAll(tmp.Path() + "/err"), "err\n");
}

// NOLINTNEXTLINE
TEST(UnixSandbox, EnvironmentOverridesParent) {
  util::TempDir tmp(test_tmpdir);
  ProcessOptions options = Shell("echo \"$HOME\"");
  options.env.push_back("HOME=/nowhere");
  options.stdout_file = tmp.Path() + "/out";
  UnixSandbox sandbox;
  sandbox.Run(options);
  EXPECT_EQ(util::File::ReadAll(tmp.Path() + "/out"), "/nowhere\n");
}

// NOLINTNEXTLINE
TEST(UnixSandbox, WallLimitNotReached) {
  ProcessOptions options = Shell("sleep 0.1");
  options.wall_limit_millis = 2000;
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(options);
  EXPECT_EQ(status.signal, 0);
  EXPECT_EQ(status.exit_code, 0);
  EXPECT_FALSE(status.timed_out);
  EXPECT_GE(status.wall_time_millis, 90);
}

// NOLINTNEXTLINE
TEST(UnixSandbox, WallLimitExceeded) {
  ProcessOptions options = Shell("sleep 10");
  options.wall_limit_millis = 100;
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(options);
  EXPECT_TRUE(status.timed_out);
  EXPECT_EQ(status.signal, 9);
  EXPECT_GE(status.wall_time_millis, 100);
  EXPECT_LE(status.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixSandbox, CancellationKillsChild) {
  util::CancellationToken cancel;
  ProcessOptions options = Shell("sleep 10");
  options.cancel = &cancel;
  std::thread aborter([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.Abort();
  });
  UnixSandbox sandbox;
  ProcessStatus status = sandbox.Run(options);
  aborter.join();
  EXPECT_TRUE(status.cancelled);
  EXPECT_FALSE(status.timed_out);
  EXPECT_EQ(status.signal, 9);
  EXPECT_LE(status.wall_time_millis, 5000);
}

// NOLINTNEXTLINE
TEST(Sandbox, CreateSandboxRunsProcesses) {
  std::unique_ptr<Sandbox> sandbox = CreateSandbox();
  ASSERT_TRUE(sandbox);
  EXPECT_EQ(sandbox->Run(Shell("exit 3")).exit_code, 3);
}

}  // namespace
