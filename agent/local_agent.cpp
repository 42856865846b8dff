#include "agent/local_agent.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/errors.hpp"

namespace agent {

AgentResult LocalAgent::Run(const AgentTask& task) {
  executor::Command command;
  std::string expanded =
      ExpandCommand(command_, task, task.workspace->AgentHostDir());
  command.argv = {"sh", "-c", absl::StrCat("( ", expanded, " ) 2>&1")};
  command.workdir = task.workspace->AgentHostDir();
  command.env = {"PATCHBENCH_INSTANCE_ID=" + task.instance_id};
  command.timeout = task.timeout;
  command.cancel = cancel_;
  LOG(INFO) << task.instance_id << ": running agent " << name_
            << " on the host";

  executor::CommandResult run = executor_->Execute(command);
  if (run.cancelled) {
    throw util::CancellationRequested(
        absl::StrCat("agent ", name_, " on ", task.instance_id));
  }
  AgentResult result;
  result.exit_code = run.signal != 0 ? 128 + run.signal : run.exit_code;
  result.log = std::move(run.stdout_data);
  result.wall_time_millis = run.wall_time_millis;
  if (run.timed_out) {
    LOG(WARNING) << task.instance_id << ": agent " << name_
                 << " exceeded " << task.timeout.count() << "ms";
    result.failure_reason = proto::FailureReason::REASON_AGENT_TIMEOUT;
  }
  FinishRun(task, &result);
  return result;
}

}  // namespace agent
