#include "container/environment_manager.hpp"

#include <thread>
#include <vector>

#include "container/mock_runtime.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/errors.hpp"

namespace {

using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

util::RetryPolicy DestroyPolicy(int attempts = 3) {
  return util::RetryPolicy::Always(attempts, {std::chrono::milliseconds(1)});
}

container::ContainerSpec Spec(const std::string& name) {
  container::ContainerSpec spec;
  spec.image = "patchbench/org__repo:0123456789ab";
  spec.name = name;
  return spec;
}

executor::CommandResult Exited(int code, const std::string& out = "") {
  executor::CommandResult result;
  result.exit_code = code;
  result.stdout_data = out;
  return result;
}

class EnvironmentManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runtime_, Create(_))
        .WillByDefault(Invoke([](const container::ContainerSpec& spec) {
          return "id-" + spec.name;
        }));
    ON_CALL(runtime_, IsRunning(_)).WillByDefault(Return(true));
  }

  container::MockRuntime runtime_;
  container::InstanceRegistry registry_;
  util::CancellationToken cancel_;
  container::EnvironmentManager manager_{&runtime_, &registry_,
                                         DestroyPolicy(), &cancel_};
};

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, StartExecDestroy) {
  EXPECT_CALL(runtime_, Create(_));
  EXPECT_CALL(runtime_, Start("id-a"));
  EXPECT_CALL(runtime_,
              Exec(Field(&container::ExecRequest::script, "echo hi")))
      .WillOnce(Return(Exited(0, "hi\n")));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);

  std::shared_ptr<container::Instance> instance = manager_.Start(Spec("a"));
  EXPECT_EQ(instance->State(), container::InstanceState::RUNNING);
  EXPECT_EQ(registry_.Size(), 1);
  executor::CommandResult result = manager_.Exec(
      instance.get(), "echo hi", std::chrono::seconds(10));
  EXPECT_EQ(result.stdout_data, "hi\n");

  manager_.Destroy(instance.get());
  manager_.Destroy(instance.get());
  EXPECT_EQ(instance->State(), container::InstanceState::DESTROYED);
  EXPECT_EQ(registry_.Size(), 0);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, ConcurrentDestroyRemovesOnce) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);
  std::shared_ptr<container::Instance> instance = manager_.Start(Spec("a"));
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([this, &instance]() {
      manager_.Destroy(instance.get());
    });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_EQ(registry_.Size(), 0);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, GuardDestroysOnException) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);
  try {
    container::InstanceGuard guard(&manager_, manager_.Start(Spec("a")));
    throw std::runtime_error("stage failed");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(registry_.Size(), 0);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, FailedStartIsDestroyed) {
  EXPECT_CALL(runtime_, Start("id-a"))
      .WillOnce(Throw(util::EnvironmentFailure("no such image")));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);
  EXPECT_THROW(manager_.Start(Spec("a")),  // NOLINT
               util::EnvironmentFailure);
  EXPECT_EQ(registry_.Size(), 0);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, FailedCreateRemovesByName) {
  EXPECT_CALL(runtime_, Create(_))
      .WillOnce(Throw(util::EnvironmentFailure("docker create timed out")));
  EXPECT_CALL(runtime_, Start(_)).Times(0);
  EXPECT_CALL(runtime_, Remove("a")).Times(1);
  EXPECT_THROW(manager_.Start(Spec("a")),  // NOLINT
               util::EnvironmentFailure);
  EXPECT_EQ(registry_.Size(), 0);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, UnremovableFailedCreateIsFatal) {
  EXPECT_CALL(runtime_, Create(_))
      .WillOnce(Throw(util::EnvironmentFailure("docker create timed out")));
  EXPECT_CALL(runtime_, Remove("a"))
      .Times(3)
      .WillRepeatedly(Throw(std::runtime_error("daemon unreachable")));
  EXPECT_THROW(manager_.Start(Spec("a")),  // NOLINT
               util::FatalError);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, DeadlineCapsCommands) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Remove("id-a"));
  std::vector<std::chrono::milliseconds> requested;
  EXPECT_CALL(runtime_, Exec(_))
      .Times(2)
      .WillRepeatedly(
          Invoke([&requested](const container::ExecRequest& request) {
            requested.push_back(request.timeout);
            return Exited(0);
          }));

  container::InstanceGuard guard(&manager_, manager_.Start(Spec("a")));
  guard->SetDeadline(std::chrono::steady_clock::now() +
                     std::chrono::seconds(5));
  manager_.Exec(guard.Get(), "true", std::chrono::minutes(5));
  // A command without its own limit gets the time left.
  manager_.Exec(guard.Get(), "true", std::chrono::milliseconds(0));
  ASSERT_EQ(requested.size(), 2);
  for (std::chrono::milliseconds timeout : requested) {
    EXPECT_GT(timeout.count(), 0);
    EXPECT_LE(timeout.count(), 5000);
  }

  // Past the deadline nothing is run.
  guard->SetDeadline(std::chrono::steady_clock::now() -
                     std::chrono::milliseconds(1));
  EXPECT_THROW(manager_.Exec(guard.Get(), "true",  // NOLINT
                             std::chrono::minutes(5)),
               util::StageTimeout);
  EXPECT_EQ(guard->State(), container::InstanceState::RUNNING);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, TimeoutDestroysInstance) {
  EXPECT_CALL(runtime_, Start(_));
  executor::CommandResult timed_out = Exited(137);
  timed_out.timed_out = true;
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(timed_out));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);

  std::shared_ptr<container::Instance> instance = manager_.Start(Spec("a"));
  EXPECT_THROW(manager_.Exec(instance.get(), "sleep 100",  // NOLINT
                             std::chrono::milliseconds(10)),
               util::StageTimeout);
  EXPECT_EQ(instance->State(), container::InstanceState::DESTROYED);
  EXPECT_EQ(registry_.Size(), 0);
  // A guard released later does not remove it again.
  container::InstanceGuard guard(&manager_, instance);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, CrashIsDetected) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(Exited(137)));
  EXPECT_CALL(runtime_, IsRunning("id-a")).WillOnce(Return(false));
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);

  container::InstanceGuard guard(&manager_, manager_.Start(Spec("a")));
  EXPECT_THROW(manager_.Exec(guard.Get(), "python -c 'boom'",  // NOLINT
                             std::chrono::seconds(1)),
               util::EnvironmentFailure);
  EXPECT_EQ(guard->State(), container::InstanceState::CRASHED);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, FailingCommandIsNotACrash) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Exec(_)).WillOnce(Return(Exited(1)));
  EXPECT_CALL(runtime_, Remove(_));
  container::InstanceGuard guard(&manager_, manager_.Start(Spec("a")));
  EXPECT_EQ(
      manager_.Exec(guard.Get(), "false", std::chrono::seconds(1)).exit_code,
      1);
  EXPECT_EQ(guard->State(), container::InstanceState::RUNNING);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, AbortedExecThrows) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Exec(_)).Times(0);
  EXPECT_CALL(runtime_, Remove(_));
  container::InstanceGuard guard(&manager_, manager_.Start(Spec("a")));
  cancel_.Abort();
  EXPECT_THROW(manager_.Exec(guard.Get(), "true",  // NOLINT
                             std::chrono::seconds(1)),
               util::CancellationRequested);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, DestroyAll) {
  EXPECT_CALL(runtime_, Start(_)).Times(3);
  EXPECT_CALL(runtime_, Remove("id-a")).Times(1);
  EXPECT_CALL(runtime_, Remove("id-b")).Times(1);
  EXPECT_CALL(runtime_, Remove("id-c")).Times(1);
  auto a = manager_.Start(Spec("a"));
  auto b = manager_.Start(Spec("b"));
  auto c = manager_.Start(Spec("c"));
  manager_.Destroy(b.get());
  manager_.DestroyAll();
  EXPECT_EQ(registry_.Size(), 0);
  EXPECT_EQ(a->State(), container::InstanceState::DESTROYED);
  EXPECT_EQ(c->State(), container::InstanceState::DESTROYED);
}

// NOLINTNEXTLINE
TEST_F(EnvironmentManagerTest, RemovalFailureIsFatal) {
  EXPECT_CALL(runtime_, Start(_));
  EXPECT_CALL(runtime_, Remove("id-a"))
      .Times(3)
      .WillRepeatedly(Throw(std::runtime_error("daemon unreachable")));
  auto instance = manager_.Start(Spec("a"));
  EXPECT_THROW(manager_.Destroy(instance.get()),  // NOLINT
               util::FatalError);
  // Still tracked, so that shutdown can try again.
  EXPECT_EQ(registry_.Size(), 1);
  EXPECT_NE(instance->State(), container::InstanceState::DESTROYED);
}

}  // namespace
