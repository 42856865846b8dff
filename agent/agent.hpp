#ifndef AGENT_AGENT_HPP
#define AGENT_AGENT_HPP

#include <chrono>
#include <string>

#include "container/environment_manager.hpp"
#include "container/workspace.hpp"
#include "proto/result.pb.h"

namespace agent {

struct AgentTask {
  std::string instance_id;
  std::string prompt;
  container::Instance* instance = nullptr;
  // The agent works in its agent directory; the patch is captured from there.
  container::Workspace* workspace = nullptr;
  std::chrono::milliseconds timeout{0};
};

struct AgentResult {
  // Empty unless failure_reason is REASON_NONE.
  std::string patch;
  // REASON_NONE, REASON_AGENT_TIMEOUT, REASON_AGENT_CRASH_EXIT or
  // REASON_NO_PATCH_PRODUCED.
  proto::FailureReason failure_reason = proto::FailureReason::REASON_NONE;
  int32_t exit_code = 0;
  // Combined standard output and error of the agent.
  std::string log;
  proto::TokenUsage tokens;
  int64_t wall_time_millis = 0;

  bool Success() const {
    return failure_reason == proto::FailureReason::REASON_NONE;
  }
};

// A coding agent, run as an opaque command.
class Agent {
 public:
  virtual const std::string& Name() const = 0;

  // Runs the agent on the task. Timeouts, failing exits and empty patches are
  // reported in the result. Throws util::EnvironmentFailure if the instance
  // died and util::CancellationRequested on abort.
  virtual AgentResult Run(const AgentTask& task) = 0;

  Agent() = default;
  virtual ~Agent() = default;
  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;
  Agent(Agent&&) = delete;
  Agent& operator=(Agent&&) = delete;
};

// Substitutes {prompt}, {workspace} and {instance_id} in command, quoting
// the values for the shell.
std::string ExpandCommand(const std::string& command, const AgentTask& task,
                          const std::string& workspace_path);

// Captures the patch of a finished run and fills the failure reason.
void FinishRun(const AgentTask& task, AgentResult* result);

}  // namespace agent

#endif
