#ifndef AGENT_AGENT_BUILDER_HPP
#define AGENT_AGENT_BUILDER_HPP

#include <memory>
#include <string>

#include "agent/agent.hpp"
#include "container/environment_manager.hpp"
#include "executor/executor.hpp"
#include "util/cancellation.hpp"

namespace agent {

struct AgentOptions {
  enum class Mode { CONTAINER, LOCAL };
  std::string name;
  Mode mode = Mode::CONTAINER;
  std::string command;
};

// Parses "container" or "local". Returns false for anything else.
bool ParseMode(const std::string& text, AgentOptions::Mode* mode);

class AgentBuilder {
 public:
  static std::unique_ptr<Agent> Get(const AgentOptions& options,
                                    container::EnvironmentManager* manager,
                                    executor::Executor* executor,
                                    const util::CancellationToken* cancel);
};

}  // namespace agent

#endif
