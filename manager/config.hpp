#ifndef MANAGER_CONFIG_HPP
#define MANAGER_CONFIG_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "agent/agent_builder.hpp"
#include "container/runtime.hpp"
#include "patch/patch_analyzer.hpp"
#include "selector/test_selector.hpp"

namespace manager {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Everything a run needs to know, taken from the command line.
struct Config {
  std::string specs;
  std::string results;
  std::string store_directory;
  std::string temp_directory;
  std::string test_log_dir;

  int concurrency = 0;
  int test_workers = 0;
  std::chrono::seconds instance_timeout{0};
  std::chrono::seconds agent_timeout{0};
  std::chrono::seconds per_test_timeout{0};
  std::chrono::seconds build_timeout{0};
  int build_attempts = 0;
  std::chrono::seconds negative_cache_ttl{0};
  std::chrono::seconds grace_period{0};

  container::ResourceLimits limits;
  std::string container_runtime;

  std::string agent_name;
  std::string agent_mode;
  std::string agent_command;
  // When set, the agents are read from this file instead of the three
  // fields above.
  std::string agents_file;
  std::string test_command;

  patch::PatchOptions patch;
  selector::SelectionOptions selection;
  // Zero means no limit.
  int max_specs_per_repo = 0;
  bool resume = false;

  static Config FromFlags();

  // Throws ConfigError describing the first invalid setting.
  void Validate() const;

  // The agents to evaluate, in order. Throws ConfigError if the agents file
  // cannot be read or an agent is invalid.
  std::vector<agent::AgentOptions> Agents() const;
};

}  // namespace manager

#endif
