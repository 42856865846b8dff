#include <memory>

#include "agent/agent_builder.hpp"
#include "agent/container_agent.hpp"
#include "agent/local_agent.hpp"
#include "container/fake_workspace.hpp"
#include "container/mock_runtime.hpp"
#include "executor/local_executor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;

const std::string test_tmpdir = "/tmp/patchbench_testdir";

const char kPatch[] =
    "diff --git a/a.py b/a.py\n"
    "--- a/a.py\n"
    "+++ b/a.py\n"
    "@@ -1 +1 @@\n"
    "-x = 1\n"
    "+x = 2\n";

executor::CommandResult Exited(int code, const std::string& out = "") {
  executor::CommandResult result;
  result.exit_code = code;
  result.stdout_data = out;
  return result;
}

// NOLINTNEXTLINE
TEST(Agent, ExpandCommand) {
  agent::AgentTask task;
  task.instance_id = "org__repo-1";
  task.prompt = "Fix the bug in 'parse'";
  EXPECT_EQ(agent::ExpandCommand("run --id {instance_id} --dir {workspace} "
                                 "--prompt {prompt}",
                                 task, "/workspace"),
            "run --id org__repo-1 --dir /workspace --prompt "
            "'Fix the bug in '\\''parse'\\'''");
}

class ContainerAgentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runtime_, Create(_)).WillByDefault(Return("abc"));
    ON_CALL(runtime_, IsRunning(_)).WillByDefault(Return(true));
    EXPECT_CALL(runtime_, Start(_));
    EXPECT_CALL(runtime_, Remove("abc")).Times(1);
    container::ContainerSpec spec;
    spec.name = "pb-1";
    instance_ = manager_.Start(spec);
    task_.instance_id = "org__repo-1";
    task_.prompt = "fix it";
    task_.instance = instance_.get();
    task_.workspace = &workspace_;
    task_.timeout = std::chrono::seconds(10);
  }
  void TearDown() override { manager_.Destroy(instance_.get()); }

  container::MockRuntime runtime_;
  container::InstanceRegistry registry_;
  container::EnvironmentManager manager_{
      &runtime_, &registry_,
      util::RetryPolicy::Always(1, {std::chrono::milliseconds(1)}), nullptr};
  std::shared_ptr<container::Instance> instance_;
  container::FakeWorkspace workspace_;
  agent::AgentTask task_;
  agent::ContainerAgent agent_{"fake-agent", "agent-cli {prompt}", &manager_};
};

// NOLINTNEXTLINE
TEST_F(ContainerAgentTest, ProducesPatch) {
  EXPECT_CALL(runtime_,
              Exec(AllOf(Field(&container::ExecRequest::workdir, "/workspace"),
                         Field(&container::ExecRequest::script,
                               "( agent-cli 'fix it' ) 2>&1"))))
      .WillOnce(Return(Exited(0,
                              "working...\n"
                              "\xe2\x94\x82 Input Tokens  \xe2\x94\x82 1200 "
                              "\xe2\x94\x82\n"
                              "\xe2\x94\x82 Output Tokens \xe2\x94\x82 300 "
                              "\xe2\x94\x82\n")));
  workspace_.patch = kPatch;
  agent::AgentResult result = agent_.Run(task_);
  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.patch, kPatch);
  EXPECT_THAT(result.log, HasSubstr("working..."));
  EXPECT_EQ(result.tokens.input_tokens(), 1200);
  EXPECT_EQ(result.tokens.output_tokens(), 300);
  EXPECT_EQ(result.tokens.total_tokens(), 1500);
}

// NOLINTNEXTLINE
TEST_F(ContainerAgentTest, CrashExit) {
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(Exited(2, "Traceback")));
  workspace_.patch = kPatch;
  agent::AgentResult result = agent_.Run(task_);
  EXPECT_EQ(result.failure_reason,
            proto::FailureReason::REASON_AGENT_CRASH_EXIT);
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.patch.empty());
  EXPECT_EQ(workspace_.captures, 0);
}

// NOLINTNEXTLINE
TEST_F(ContainerAgentTest, NoPatchProduced) {
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(Exited(0, "nothing to do")));
  workspace_.patch = "\n";
  agent::AgentResult result = agent_.Run(task_);
  EXPECT_EQ(result.failure_reason,
            proto::FailureReason::REASON_NO_PATCH_PRODUCED);
  EXPECT_EQ(workspace_.captures, 1);
}

// NOLINTNEXTLINE
TEST_F(ContainerAgentTest, Timeout) {
  executor::CommandResult timed_out = Exited(137);
  timed_out.timed_out = true;
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(timed_out));
  agent::AgentResult result = agent_.Run(task_);
  EXPECT_EQ(result.failure_reason,
            proto::FailureReason::REASON_AGENT_TIMEOUT);
  EXPECT_EQ(instance_->State(), container::InstanceState::DESTROYED);
  EXPECT_EQ(workspace_.captures, 0);
}

// NOLINTNEXTLINE
TEST(LocalAgent, RunsOnTheHost) {
  util::TempDir tmp(test_tmpdir);
  executor::LocalExecutor executor(test_tmpdir);
  container::FakeWorkspace workspace;
  workspace.host_dir = tmp.Path();
  workspace.patch = kPatch;
  agent::LocalAgent agent(
      "local", "echo {instance_id} > id.txt && cat id.txt && echo err >&2",
      &executor, nullptr);
  agent::AgentTask task;
  task.instance_id = "org__repo-7";
  task.workspace = &workspace;
  task.timeout = std::chrono::seconds(10);
  agent::AgentResult result = agent.Run(task);
  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.log, "org__repo-7\nerr\n");
  EXPECT_EQ(util::File::ReadAll(util::File::JoinPath(tmp.Path(), "id.txt")),
            "org__repo-7\n");
  EXPECT_EQ(result.patch, kPatch);
}

// NOLINTNEXTLINE
TEST(LocalAgent, Timeout) {
  util::TempDir tmp(test_tmpdir);
  executor::LocalExecutor executor(test_tmpdir);
  container::FakeWorkspace workspace;
  workspace.host_dir = tmp.Path();
  agent::LocalAgent agent("local", "sleep 10", &executor, nullptr);
  agent::AgentTask task;
  task.workspace = &workspace;
  task.timeout = std::chrono::milliseconds(100);
  EXPECT_EQ(agent.Run(task).failure_reason,
            proto::FailureReason::REASON_AGENT_TIMEOUT);
}

// NOLINTNEXTLINE
TEST(AgentBuilder, Modes) {
  agent::AgentOptions::Mode mode;
  EXPECT_TRUE(agent::ParseMode("local", &mode));
  EXPECT_EQ(mode, agent::AgentOptions::Mode::LOCAL);
  EXPECT_TRUE(agent::ParseMode("container", &mode));
  EXPECT_EQ(mode, agent::AgentOptions::Mode::CONTAINER);
  EXPECT_FALSE(agent::ParseMode("remote", &mode));

  executor::LocalExecutor executor(test_tmpdir);
  agent::AgentOptions options;
  options.name = "my-agent";
  options.command = "true";
  options.mode = agent::AgentOptions::Mode::LOCAL;
  std::unique_ptr<agent::Agent> local =
      agent::AgentBuilder::Get(options, nullptr, &executor, nullptr);
  EXPECT_NE(dynamic_cast<agent::LocalAgent*>(local.get()), nullptr);
  EXPECT_EQ(local->Name(), "my-agent");
  options.mode = agent::AgentOptions::Mode::CONTAINER;
  std::unique_ptr<agent::Agent> in_container =
      agent::AgentBuilder::Get(options, nullptr, &executor, nullptr);
  EXPECT_NE(dynamic_cast<agent::ContainerAgent*>(in_container.get()), nullptr);
}

}  // namespace
