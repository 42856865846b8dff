#ifndef CONTAINER_WORKSPACE_HPP
#define CONTAINER_WORKSPACE_HPP

#include <chrono>
#include <memory>
#include <string>

#include "container/environment_manager.hpp"
#include "container/instance_tree.hpp"
#include "patch/working_tree.hpp"

namespace container {

// The source trees used while evaluating one spec: the base tree, where the
// repository is checked out and the test patch goes, the candidate tree, a
// copy of the base tree with the agent's patch applied, the reference tree,
// a copy of the base tree with the gold patch applied, and the agent
// workspace, a directory shared between the host and the instance.
class Workspace {
 public:
  // Checks out commit in the base tree, discarding local changes.
  virtual void Checkout(const std::string& commit) = 0;

  // Fills the agent workspace with a copy of the base tree.
  virtual void PrepareAgentWorkspace() = 0;

  // Returns every change made in the agent workspace as a git diff.
  virtual std::string CapturePatch() = 0;

  // Replace the candidate or the reference tree with a copy of the base tree.
  virtual void ForkCandidate() = 0;
  virtual void ForkReference() = 0;

  virtual patch::WorkingTree* BaseTree() = 0;
  virtual patch::WorkingTree* CandidateTree() = 0;
  virtual patch::WorkingTree* ReferenceTree() = 0;

  // Paths inside the instance.
  virtual std::string BaseDir() const = 0;
  virtual std::string CandidateDir() const = 0;
  virtual std::string ReferenceDir() const = 0;
  virtual std::string AgentDir() const = 0;
  // The agent workspace as seen from the host.
  virtual std::string AgentHostDir() const = 0;

  // Hands the agent workspace back to the host user and removes it. Errors
  // are logged, except util::FatalError from destroying a timed out
  // instance.
  virtual void Release() = 0;

  Workspace() = default;
  virtual ~Workspace() = default;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace(Workspace&&) = delete;
  Workspace& operator=(Workspace&&) = delete;
};

// Workspace inside an instance created from a patchbench image. Errors are
// reported with util::EnvironmentFailure.
class InstanceWorkspace : public Workspace {
 public:
  static const char kBaseDir[];
  static const char kCandidateDir[];
  static const char kReferenceDir[];
  static const char kAgentDir[];

  // host_dir must be bind mounted on kAgentDir when the instance is created.
  InstanceWorkspace(EnvironmentManager* manager, Instance* instance,
                    std::string host_dir, std::chrono::milliseconds timeout);

  void Checkout(const std::string& commit) override;
  void PrepareAgentWorkspace() override;
  std::string CapturePatch() override;
  void ForkCandidate() override;
  void ForkReference() override;
  patch::WorkingTree* BaseTree() override { return &base_; }
  patch::WorkingTree* CandidateTree() override { return &candidate_; }
  patch::WorkingTree* ReferenceTree() override { return &reference_; }
  std::string BaseDir() const override { return kBaseDir; }
  std::string CandidateDir() const override { return kCandidateDir; }
  std::string ReferenceDir() const override { return kReferenceDir; }
  std::string AgentDir() const override { return kAgentDir; }
  std::string AgentHostDir() const override { return host_dir_; }
  void Release() override;

 private:
  std::string Run(const std::string& what, const std::string& script,
                  const std::string& workdir);
  void Fork(const std::string& dir);

  EnvironmentManager* manager_;
  Instance* instance_;
  std::string host_dir_;
  std::chrono::milliseconds timeout_;
  InstanceTree base_;
  InstanceTree candidate_;
  InstanceTree reference_;
};

}  // namespace container

#endif
