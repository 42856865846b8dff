#ifndef CONTAINER_INSTANCE_TREE_HPP
#define CONTAINER_INSTANCE_TREE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "container/environment_manager.hpp"
#include "patch/working_tree.hpp"

namespace container {

// A source tree inside a running instance, accessed through shell commands.
// Every method throws util::EnvironmentFailure if the command fails.
class InstanceTree : public patch::WorkingTree {
 public:
  InstanceTree(EnvironmentManager* manager, Instance* instance,
               std::string root, std::chrono::milliseconds timeout)
      : manager_(manager),
        instance_(instance),
        root_(std::move(root)),
        timeout_(timeout) {}

  absl::optional<std::string> ReadFile(const std::string& path) override;
  void WriteFile(const std::string& path, const std::string& content) override;
  void RemoveFile(const std::string& path) override;
  std::vector<std::string> ListFiles() override;

  const std::string& Root() const { return root_; }

 private:
  executor::CommandResult Run(const std::string& what,
                              const std::string& script,
                              const std::string& stdin_data = "");

  EnvironmentManager* manager_;
  Instance* instance_;
  std::string root_;
  std::chrono::milliseconds timeout_;
};

}  // namespace container

#endif
