#include "manager/task_plan.hpp"

#include <map>

#include "glog/logging.h"

namespace manager {

TaskPlan PlanTasks(const std::vector<proto::EvaluationSpec>& specs,
                   const PlanOptions& options) {
  TaskPlan plan;
  std::map<std::string, int> per_repo;
  for (size_t i = 0; i < specs.size(); i++) {
    const proto::EvaluationSpec& spec = specs[i];
    int kept = ++per_repo[spec.repo()];
    if (options.max_specs_per_repo > 0 && kept > options.max_specs_per_repo) {
      plan.over_repo_limit++;
      continue;
    }
    for (const std::string& agent : options.agents) {
      plan.evaluated.emplace_back(spec.instance_id(), agent);
      if (options.resume != nullptr &&
          options.resume->IsDone(spec.instance_id(), agent)) {
        VLOG(1) << spec.instance_id() << " is already done with " << agent;
        plan.skipped_done++;
        continue;
      }
      core::SpecTask task;
      task.spec = spec;
      task.sequence = i;
      task.agent = agent;
      plan.tasks.push_back(std::move(task));
    }
  }
  return plan;
}

}  // namespace manager
