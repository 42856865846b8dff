#include <pthread.h>
#include <signal.h>
#include <string.h>

#include <map>
#include <thread>

#include "absl/memory/memory.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "agent/agent_builder.hpp"
#include "container/docker_runtime.hpp"
#include "container/environment_manager.hpp"
#include "container/image_cache.hpp"
#include "container/workspace.hpp"
#include "core/orchestrator.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/config.hpp"
#include "manager/pipeline.hpp"
#include "manager/results_log.hpp"
#include "manager/spec_source.hpp"
#include "manager/task_plan.hpp"
#include "manager/test_runner.hpp"
#include "util/errors.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

enum ExitCode {
  ALL_RESOLVED = 0,
  NOT_ALL_RESOLVED = 1,
  CONFIG_ERROR = 2,
  ABORTED = 3,
  FATAL_ERROR = 4
};

// Sent to the watcher thread to make it exit.
const int kWatcherQuit = SIGUSR1;

// Turns SIGINT and SIGTERM into cancellation requests. The first signal stops
// the scheduling of new specs and, after the grace period, aborts the
// running ones; a second signal aborts immediately. The signals must be
// blocked in every thread.
class SignalWatcher {
 public:
  SignalWatcher(util::CancellationToken* cancel, absl::Duration grace_period)
      : cancel_(cancel), grace_period_(grace_period) {
    thread_ = std::thread(&SignalWatcher::ThreadBody, this);
  }

  ~SignalWatcher() {
    done_.Notify();
    pthread_kill(thread_.native_handle(), kWatcherQuit);
    thread_.join();
    if (grace_.joinable()) grace_.join();
  }

  static void BlockSignals() {
    sigset_t signals = Signals();
    int err = pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    CHECK_EQ(err, 0) << "pthread_sigmask: " << strerror(err);
  }

 private:
  static sigset_t Signals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, kWatcherQuit);
    return signals;
  }

  void ThreadBody() {
    sigset_t signals = Signals();
    while (true) {
      int received = 0;
      if (sigwait(&signals, &received) != 0) continue;
      if (received == kWatcherQuit) {
        if (done_.HasBeenNotified()) return;
        continue;
      }
      if (!cancel_->StopRequested()) {
        LOG(WARNING) << "Received " << strsignal(received)
                     << ", waiting for the running specs for "
                     << absl::FormatDuration(grace_period_);
        cancel_->RequestStop();
        grace_ = std::thread([this]() {
          if (!done_.WaitForNotificationWithTimeout(grace_period_)) {
            LOG(WARNING) << "Grace period expired, aborting the running specs";
            cancel_->Abort();
          }
        });
      } else if (!cancel_->Aborted()) {
        LOG(WARNING) << "Received " << strsignal(received)
                     << " again, aborting the running specs";
        cancel_->Abort();
      }
    }
  }

  util::CancellationToken* cancel_;
  absl::Duration grace_period_;
  absl::Notification done_;
  std::thread thread_;
  std::thread grace_;
};

int ExitCodeFor(const std::vector<manager::RecordKey>& evaluated,
                const manager::ResultsLog& log,
                const util::CancellationToken& cancel) {
  if (cancel.StopRequested()) return ABORTED;
  std::map<manager::RecordKey, proto::ResultRecord> latest = log.Latest();
  size_t resolved = 0;
  for (const manager::RecordKey& key : evaluated) {
    auto it = latest.find(key);
    if (it != latest.end() &&
        it->second.verdict() == proto::Verdict::VERDICT_RESOLVED) {
      resolved++;
    }
  }
  LOG(INFO) << resolved << " of " << evaluated.size()
            << " evaluations resolved";
  return resolved == evaluated.size() ? ALL_RESOLVED : NOT_ALL_RESOLVED;
}

// Aborts what is still running and removes every instance.
int Shutdown(const std::exception& exc, container::EnvironmentManager* manager,
             util::CancellationToken* cancel) {
  LOG(ERROR) << "Fatal error: " << exc.what();
  cancel->Abort();
  try {
    manager->DestroyAll();
  } catch (const util::FatalError& cleanup) {
    LOG(ERROR) << "Instances left behind: " << cleanup.what();
  }
  return FATAL_ERROR;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Evaluates coding agents on a list of specs:\n"
      "  patchbench --specs specs.jsonl --agent_command 'agent {prompt}'\n"
      "  patchbench --specs specs.jsonl --agents agents.json");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  manager::Config config = manager::Config::FromFlags();
  std::vector<proto::EvaluationSpec> specs;
  std::vector<agent::AgentOptions> agent_options;
  try {
    config.Validate();
    agent_options = config.Agents();
    specs = manager::LoadSpecs(config.specs);
  } catch (const manager::ConfigError& exc) {
    LOG(ERROR) << exc.what();
    return CONFIG_ERROR;
  } catch (const manager::SpecError& exc) {
    LOG(ERROR) << "Invalid spec file: " << exc.what();
    return CONFIG_ERROR;
  }

  // Before any thread is started, so that every thread inherits the mask.
  SignalWatcher::BlockSignals();
  util::CancellationToken cancel;

  executor::LocalExecutor executor(config.temp_directory);
  container::DockerRuntime runtime(&executor, config.container_runtime);

  container::ImageCacheOptions cache_options;
  cache_options.store_directory = config.store_directory;
  cache_options.build_timeout = config.build_timeout;
  cache_options.negative_ttl = config.negative_cache_ttl;
  cache_options.build_attempts = config.build_attempts;
  container::ImageCache images(&runtime, cache_options);

  container::InstanceRegistry registry;
  container::EnvironmentManager manager(
      &runtime, &registry,
      util::RetryPolicy::Always(
          3, {std::chrono::seconds(1), std::chrono::seconds(5)}),
      &cancel);

  std::vector<std::unique_ptr<agent::Agent>> agents;
  std::vector<agent::Agent*> agent_ptrs;
  manager::PlanOptions plan_options;
  plan_options.max_specs_per_repo = config.max_specs_per_repo;
  for (const agent::AgentOptions& options : agent_options) {
    agents.push_back(
        agent::AgentBuilder::Get(options, &manager, &executor, &cancel));
    agent_ptrs.push_back(agents.back().get());
    plan_options.agents.push_back(agents.back()->Name());
  }

  manager::TestRunnerOptions test_options;
  test_options.workers = config.test_workers;
  test_options.per_test_timeout = config.per_test_timeout;
  test_options.log_dir = config.test_log_dir;
  manager::TestRunner tests(&manager, test_options);

  manager::PipelineOptions pipeline_options;
  pipeline_options.limits = config.limits;
  pipeline_options.workspace_root =
      util::File::JoinPath(config.store_directory, "workspaces");
  pipeline_options.instance_timeout = config.instance_timeout;
  pipeline_options.agent_timeout = config.agent_timeout;
  pipeline_options.test_command = config.test_command;
  pipeline_options.patch = config.patch;
  pipeline_options.selection = config.selection;
  std::chrono::milliseconds command_timeout = pipeline_options.command_timeout;
  manager::Pipeline pipeline(
      &images, &manager,
      [&manager, command_timeout](container::Instance* instance,
                                  const std::string& host_dir) {
        return absl::make_unique<container::InstanceWorkspace>(
            &manager, instance, host_dir, command_timeout);
      },
      agent_ptrs, &tests, pipeline_options, &cancel);

  manager::ResultsLog log(config.results);
  if (config.resume) plan_options.resume = &log;
  int exit_code = FATAL_ERROR;
  {
    SignalWatcher watcher(&cancel, absl::FromChrono(config.grace_period));
    try {
      log.Setup();
      manager::TaskPlan plan = manager::PlanTasks(specs, plan_options);
      if (plan.over_repo_limit > 0) {
        LOG(INFO) << "Skipping " << plan.over_repo_limit
                  << " specs over the per-repository limit";
      }
      if (plan.skipped_done > 0) {
        LOG(INFO) << "Skipping " << plan.skipped_done
                  << " evaluations already done";
      }
      images.Setup();
      core::Orchestrator orchestrator(&pipeline, config.concurrency, &cancel);
      orchestrator.Run(plan.tasks, [&log](const proto::ResultRecord& record) {
        log.Append(record);
      });
      manager.DestroyAll();
      images.TearDown();
      log.TearDown();
      exit_code = ExitCodeFor(plan.evaluated, log, cancel);
    } catch (const util::FatalError& exc) {
      exit_code = Shutdown(exc, &manager, &cancel);
    } catch (const std::system_error& exc) {
      exit_code = Shutdown(exc, &manager, &cancel);
    }
  }
  return exit_code;
}
