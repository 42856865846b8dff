#ifndef CONTAINER_RUNTIME_HPP
#define CONTAINER_RUNTIME_HPP

#include <chrono>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "util/cancellation.hpp"

namespace container {

struct Mount {
  std::string host_path;
  std::string container_path;
  bool read_only = false;
};

// Applied when the container is created and never changed afterwards.
struct ResourceLimits {
  double cpus = 0;
  int64_t memory_mb = 0;
  // Accelerators visible in the container, in the runtime's syntax. Empty
  // hides every accelerator.
  std::string gpus;
  std::string network;
};

struct ContainerSpec {
  std::string image;
  std::string name;
  ResourceLimits limits;
  std::vector<Mount> mounts;
  // NAME=value pairs.
  std::vector<std::string> env;
};

struct ExecRequest {
  std::string container_id;
  // Run with sh -c.
  std::string script;
  std::string workdir;
  std::string stdin_data;
  std::chrono::milliseconds timeout{0};
  const util::CancellationToken* cancel = nullptr;
};

// Container engine operations used by the image cache and the environment
// manager.
class Runtime {
 public:
  virtual bool HasImage(const std::string& tag) = 0;

  // Builds tag from the given Dockerfile. Throws util::BuildTimeout if the
  // build does not finish within timeout, util::BuildFailure on any other
  // error.
  virtual void BuildImage(const std::string& tag, const std::string& dockerfile,
                          std::chrono::milliseconds timeout,
                          const util::CancellationToken* cancel) = 0;

  // Creates a stopped container and returns its id. Throws
  // util::EnvironmentFailure.
  virtual std::string Create(const ContainerSpec& spec) = 0;

  // Throws util::EnvironmentFailure.
  virtual void Start(const std::string& container_id) = 0;

  // Throws std::runtime_error if the command could not be run at all.
  virtual executor::CommandResult Exec(const ExecRequest& request) = 0;

  virtual bool IsRunning(const std::string& container_id) = 0;

  // Kills and removes the container. Removing a container that does not
  // exist succeeds. Throws std::runtime_error on failure.
  virtual void Remove(const std::string& container_id) = 0;

  Runtime() = default;
  virtual ~Runtime() = default;
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(Runtime&&) = delete;
};

}  // namespace container

#endif
