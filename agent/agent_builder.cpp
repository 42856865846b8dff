#include "agent/agent_builder.hpp"

#include "agent/container_agent.hpp"
#include "agent/local_agent.hpp"

namespace agent {

bool ParseMode(const std::string& text, AgentOptions::Mode* mode) {
  if (text == "container") {
    *mode = AgentOptions::Mode::CONTAINER;
    return true;
  }
  if (text == "local") {
    *mode = AgentOptions::Mode::LOCAL;
    return true;
  }
  return false;
}

std::unique_ptr<Agent> AgentBuilder::Get(
    const AgentOptions& options, container::EnvironmentManager* manager,
    executor::Executor* executor, const util::CancellationToken* cancel) {
  if (options.mode == AgentOptions::Mode::LOCAL) {
    return std::unique_ptr<Agent>(
        new LocalAgent(options.name, options.command, executor, cancel));
  }
  return std::unique_ptr<Agent>(
      new ContainerAgent(options.name, options.command, manager));
}

}  // namespace agent
