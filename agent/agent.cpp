#include "agent/agent.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "agent/token_usage.hpp"
#include "glog/logging.h"
#include "util/misc.hpp"

namespace agent {

std::string ExpandCommand(const std::string& command, const AgentTask& task,
                          const std::string& workspace_path) {
  return absl::StrReplaceAll(
      command, {{"{prompt}", util::ShellQuote(task.prompt)},
                {"{workspace}", util::ShellQuote(workspace_path)},
                {"{instance_id}", util::ShellQuote(task.instance_id)}});
}

void FinishRun(const AgentTask& task, AgentResult* result) {
  result->tokens = ParseTokenUsage(result->log);
  if (result->failure_reason != proto::FailureReason::REASON_NONE) return;
  if (result->exit_code != 0) {
    LOG(WARNING) << task.instance_id << ": agent exited with "
                 << result->exit_code;
    result->failure_reason = proto::FailureReason::REASON_AGENT_CRASH_EXIT;
    return;
  }
  std::string patch = task.workspace->CapturePatch();
  if (absl::StripAsciiWhitespace(patch).empty()) {
    LOG(INFO) << task.instance_id << ": agent produced no changes";
    result->failure_reason = proto::FailureReason::REASON_NO_PATCH_PRODUCED;
    return;
  }
  result->patch = std::move(patch);
}

}  // namespace agent
