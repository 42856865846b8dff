#ifndef CONTAINER_FAKE_WORKSPACE_HPP
#define CONTAINER_FAKE_WORKSPACE_HPP

#include <string>

#include "container/workspace.hpp"
#include "patch/working_tree.hpp"

namespace container {

// In-memory workspace for tests.
class FakeWorkspace : public Workspace {
 public:
  void Checkout(const std::string& commit) override { checked_out = commit; }
  void PrepareAgentWorkspace() override { prepared = true; }
  std::string CapturePatch() override {
    captures++;
    return patch;
  }
  void ForkCandidate() override {
    CopyBase(&candidate);
    forks++;
  }
  void ForkReference() override {
    CopyBase(&reference);
    reference_forks++;
  }
  patch::WorkingTree* BaseTree() override { return &base; }
  patch::WorkingTree* CandidateTree() override { return &candidate; }
  patch::WorkingTree* ReferenceTree() override { return &reference; }
  std::string BaseDir() const override { return "/workdir/repo"; }
  std::string CandidateDir() const override { return "/workdir/repo_post"; }
  std::string ReferenceDir() const override { return "/workdir/repo_gold"; }
  std::string AgentDir() const override { return "/workspace"; }
  std::string AgentHostDir() const override { return host_dir; }
  void Release() override { released = true; }

  patch::MemoryTree base;
  patch::MemoryTree candidate;
  patch::MemoryTree reference;
  // Returned by CapturePatch.
  std::string patch;
  std::string host_dir = "/tmp/patchbench_testdir";
  std::string checked_out;
  bool prepared = false;
  bool released = false;
  int captures = 0;
  int forks = 0;
  int reference_forks = 0;

 private:
  void CopyBase(patch::MemoryTree* tree) {
    for (const std::string& path : tree->ListFiles()) tree->RemoveFile(path);
    for (const auto& file : base.Files()) {
      tree->WriteFile(file.first, file.second);
    }
  }
};

}  // namespace container

#endif
