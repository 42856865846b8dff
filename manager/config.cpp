#include "manager/config.hpp"

#include <sys/stat.h>

#include <set>
#include <system_error>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/util/json_util.h"
#include "proto/agents.pb.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) throw ConfigError(message);
}

void RequirePositive(int64_t value, const char* name) {
  Require(value > 0,
          absl::StrCat("--", name, " must be positive, got ", value));
}

bool IsRegularFile(const std::string& path) {
  struct stat info {};
  return stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

agent::AgentOptions MakeAgent(const std::string& name, const std::string& mode,
                              const std::string& command) {
  agent::AgentOptions options;
  options.name = name;
  options.command = command;
  Require(!name.empty(), "agent name is required");
  Require(agent::ParseMode(mode, &options.mode),
          "unknown mode " + mode + " of agent " + name +
              ", expected container or local");
  Require(!command.empty(), "command of agent " + name + " is required");
  return options;
}

proto::AgentList ReadAgentList(const std::string& path) {
  std::string text;
  try {
    text = util::File::ReadAll(path);
  } catch (const std::system_error& exc) {
    throw ConfigError("cannot read --agents " + path + ": " + exc.what());
  }
  proto::AgentList list;
  auto status = google::protobuf::util::JsonStringToMessage(text, &list);
  if (!status.ok()) {
    throw ConfigError("invalid --agents " + path + ": " + status.ToString());
  }
  return list;
}

}  // namespace

Config Config::FromFlags() {
  Config config;
  config.specs = FLAGS_specs;
  config.results = FLAGS_results;
  config.store_directory = FLAGS_store_directory;
  config.temp_directory = FLAGS_temp_directory;
  config.test_log_dir = FLAGS_test_log_dir;

  config.concurrency = FLAGS_concurrency;
  config.test_workers = FLAGS_test_workers;
  config.instance_timeout = std::chrono::seconds(FLAGS_instance_timeout);
  config.agent_timeout = std::chrono::seconds(FLAGS_agent_timeout);
  config.per_test_timeout = std::chrono::seconds(FLAGS_per_test_timeout);
  config.build_timeout = std::chrono::seconds(FLAGS_build_timeout);
  config.build_attempts = FLAGS_build_attempts;
  config.negative_cache_ttl = std::chrono::seconds(FLAGS_negative_cache_ttl);
  config.grace_period = std::chrono::seconds(FLAGS_grace_period);

  config.limits.cpus = FLAGS_cpus;
  config.limits.memory_mb = FLAGS_memory_mb;
  config.limits.gpus = FLAGS_gpus;
  config.limits.network = FLAGS_network;
  config.container_runtime = FLAGS_container_runtime;

  config.agent_name = FLAGS_agent;
  config.agent_mode = FLAGS_agent_mode;
  config.agent_command = FLAGS_agent_command;
  config.agents_file = FLAGS_agents;
  config.test_command = FLAGS_test_command;

  config.patch.fuzz = FLAGS_patch_fuzz;
  config.patch.max_offset = FLAGS_patch_max_offset;
  config.selection.max_pass_to_pass = FLAGS_max_pass_to_pass;
  config.max_specs_per_repo = FLAGS_max_specs_per_repo;
  config.resume = FLAGS_resume;
  return config;
}

void Config::Validate() const {
  Require(!specs.empty(), "--specs is required");
  Require(IsRegularFile(specs), "spec file " + specs + " does not exist");
  Require(!results.empty(), "--results is required");
  Require(!store_directory.empty(), "--store_directory is required");
  Require(!temp_directory.empty(), "--temp_directory is required");
  Require(!test_log_dir.empty(), "--test_log_dir is required");

  RequirePositive(concurrency, "concurrency");
  RequirePositive(test_workers, "test_workers");
  RequirePositive(instance_timeout.count(), "instance_timeout");
  RequirePositive(agent_timeout.count(), "agent_timeout");
  RequirePositive(per_test_timeout.count(), "per_test_timeout");
  RequirePositive(build_timeout.count(), "build_timeout");
  RequirePositive(build_attempts, "build_attempts");
  Require(negative_cache_ttl.count() >= 0,
          "--negative_cache_ttl must not be negative");
  Require(grace_period.count() >= 0, "--grace_period must not be negative");
  Require(agent_timeout <= instance_timeout,
          "--agent_timeout cannot exceed --instance_timeout");

  Require(limits.cpus >= 0, "--cpus must not be negative");
  Require(limits.memory_mb >= 0, "--memory_mb must not be negative");
  Require(limits.memory_mb == 0 || limits.memory_mb >= 64,
          "--memory_mb must be at least 64");
  Require(!container_runtime.empty(), "--container_runtime is required");

  Agents();
  Require(absl::StrContains(test_command, "{test}"),
          "--test_command must contain {test}");

  Require(patch.fuzz >= 0, "--patch_fuzz must not be negative");
  Require(patch.max_offset >= 0, "--patch_max_offset must not be negative");
  Require(selection.max_pass_to_pass >= 0,
          "--max_pass_to_pass must not be negative");
  Require(max_specs_per_repo >= 0,
          "--max_specs_per_repo must not be negative");
}

std::vector<agent::AgentOptions> Config::Agents() const {
  if (agents_file.empty()) {
    Require(!agent_name.empty(), "--agent is required");
    Require(!agent_command.empty(), "--agent_command is required");
    return {MakeAgent(agent_name, agent_mode, agent_command)};
  }
  proto::AgentList list = ReadAgentList(agents_file);
  Require(list.agents_size() > 0, "--agents " + agents_file + " is empty");
  std::vector<agent::AgentOptions> agents;
  std::set<std::string> names;
  for (const proto::AgentConfig& entry : list.agents()) {
    agents.push_back(MakeAgent(entry.name(), entry.mode(), entry.command()));
    Require(names.insert(entry.name()).second,
            "agent " + entry.name() + " is listed twice");
  }
  return agents;
}

}  // namespace manager
