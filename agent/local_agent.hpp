#ifndef AGENT_LOCAL_AGENT_HPP
#define AGENT_LOCAL_AGENT_HPP

#include <string>

#include "agent/agent.hpp"
#include "executor/executor.hpp"
#include "util/cancellation.hpp"

namespace agent {

// Runs the agent command on the host, in the host side of the agent
// directory.
class LocalAgent : public Agent {
 public:
  LocalAgent(std::string name, std::string command,
             executor::Executor* executor,
             const util::CancellationToken* cancel)
      : name_(std::move(name)),
        command_(std::move(command)),
        executor_(executor),
        cancel_(cancel) {}

  const std::string& Name() const override { return name_; }
  AgentResult Run(const AgentTask& task) override;

 private:
  std::string name_;
  std::string command_;
  executor::Executor* executor_;
  const util::CancellationToken* cancel_;
};

}  // namespace agent

#endif
