#ifndef CONTAINER_DOCKER_RUNTIME_HPP
#define CONTAINER_DOCKER_RUNTIME_HPP

#include "container/runtime.hpp"
#include "executor/executor.hpp"

namespace container {

// Runtime implemented with the docker command line client.
class DockerRuntime : public Runtime {
 public:
  DockerRuntime(executor::Executor* executor, std::string binary)
      : executor_(executor), binary_(std::move(binary)) {}

  bool HasImage(const std::string& tag) override;
  void BuildImage(const std::string& tag, const std::string& dockerfile,
                  std::chrono::milliseconds timeout,
                  const util::CancellationToken* cancel) override;
  std::string Create(const ContainerSpec& spec) override;
  void Start(const std::string& container_id) override;
  executor::CommandResult Exec(const ExecRequest& request) override;
  bool IsRunning(const std::string& container_id) override;
  void Remove(const std::string& container_id) override;

  // Command line of a docker create call, without the binary.
  static std::vector<std::string> CreateArgs(const ContainerSpec& spec);

 private:
  executor::CommandResult Run(std::vector<std::string> args,
                              std::chrono::milliseconds timeout =
                                  std::chrono::milliseconds(0),
                              const std::string& stdin_data = "",
                              const util::CancellationToken* cancel = nullptr);

  executor::Executor* executor_;
  std::string binary_;
};

}  // namespace container

#endif
