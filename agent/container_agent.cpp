#include "agent/container_agent.hpp"

#include "glog/logging.h"
#include "util/errors.hpp"

namespace agent {

AgentResult ContainerAgent::Run(const AgentTask& task) {
  std::string command =
      ExpandCommand(command_, task, task.workspace->AgentDir());
  LOG(INFO) << task.instance_id << ": running agent " << name_
            << " in the instance";
  AgentResult result;
  auto start = std::chrono::steady_clock::now();
  try {
    executor::CommandResult run = manager_->Exec(
        task.instance, "( " + command + " ) 2>&1", task.timeout,
        task.workspace->AgentDir());
    result.exit_code = run.signal != 0 ? 128 + run.signal : run.exit_code;
    result.log = std::move(run.stdout_data);
  } catch (const util::StageTimeout& exc) {
    LOG(WARNING) << task.instance_id << ": " << exc.what();
    result.failure_reason = proto::FailureReason::REASON_AGENT_TIMEOUT;
  }
  result.wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  FinishRun(task, &result);
  return result;
}

}  // namespace agent
