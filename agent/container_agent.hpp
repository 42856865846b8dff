#ifndef AGENT_CONTAINER_AGENT_HPP
#define AGENT_CONTAINER_AGENT_HPP

#include <string>

#include "agent/agent.hpp"
#include "container/environment_manager.hpp"

namespace agent {

// Runs the agent command inside the instance, in the agent directory.
class ContainerAgent : public Agent {
 public:
  ContainerAgent(std::string name, std::string command,
                 container::EnvironmentManager* manager)
      : name_(std::move(name)),
        command_(std::move(command)),
        manager_(manager) {}

  const std::string& Name() const override { return name_; }
  AgentResult Run(const AgentTask& task) override;

 private:
  std::string name_;
  std::string command_;
  container::EnvironmentManager* manager_;
};

}  // namespace agent

#endif
