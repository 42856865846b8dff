#ifndef MANAGER_PIPELINE_HPP
#define MANAGER_PIPELINE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "agent/agent.hpp"
#include "container/environment_manager.hpp"
#include "container/image_cache.hpp"
#include "container/workspace.hpp"
#include "core/orchestrator.hpp"
#include "manager/test_runner.hpp"
#include "patch/patch_analyzer.hpp"
#include "selector/test_selector.hpp"
#include "util/cancellation.hpp"

namespace manager {

struct PipelineOptions {
  container::ResourceLimits limits;
  // Host directory under which agent workspaces are created.
  std::string workspace_root;
  // Budget of a whole spec, from image preparation to scoring.
  std::chrono::milliseconds instance_timeout{std::chrono::hours(1)};
  std::chrono::milliseconds agent_timeout{std::chrono::minutes(30)};
  // Budget of checkouts, copies and file accesses inside the instance.
  std::chrono::milliseconds command_timeout{std::chrono::minutes(5)};
  // Used when the spec's environment does not name a test command.
  std::string test_command;
  patch::PatchOptions patch;
  selector::SelectionOptions selection;
};

using WorkspaceFactory = std::function<std::unique_ptr<container::Workspace>(
    container::Instance* instance, const std::string& host_dir)>;

// Name of the instance evaluating the spec at position sequence with the
// given agent.
std::string InstanceName(const std::string& instance_id,
                         const std::string& agent, int64_t sequence);

// Evaluates a spec through the stages ImagePreparing, AgentRunning,
// PatchValidating, TestingPre, TestingPost and Scored. The instance started
// for the spec is destroyed before the record is returned. Each task names
// one of the agents; an empty name selects the first.
class Pipeline : public core::SpecProcessor {
 public:
  Pipeline(container::ImageCache* images,
           container::EnvironmentManager* manager,
           WorkspaceFactory workspace_factory,
           std::vector<agent::Agent*> agents,
           PhaseRunner* tests, PipelineOptions options,
           const util::CancellationToken* cancel)
      : images_(images),
        manager_(manager),
        workspace_factory_(std::move(workspace_factory)),
        agents_(std::move(agents)),
        tests_(tests),
        options_(std::move(options)),
        cancel_(cancel) {}

  proto::ResultRecord Process(const core::SpecTask& task) override;

 private:
  class Attempt;

  // Throws FatalError if no agent has the name.
  agent::Agent* FindAgent(const std::string& name) const;

  void RunStages(const proto::EvaluationSpec& spec, agent::Agent* agent,
                 Attempt* attempt);

  // Runs the derived tests with the gold patch applied and keeps the ones
  // passing there. Returns false if the record was finished instead.
  bool ConfirmDerivedTests(const proto::EvaluationSpec& spec,
                           Attempt* attempt, PhaseRequest request,
                           selector::Selection* selection);

  container::ImageCache* images_;
  container::EnvironmentManager* manager_;
  WorkspaceFactory workspace_factory_;
  std::vector<agent::Agent*> agents_;
  PhaseRunner* tests_;
  PipelineOptions options_;
  const util::CancellationToken* cancel_;
};

}  // namespace manager

#endif
