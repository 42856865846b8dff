#ifndef MANAGER_TASK_PLAN_HPP
#define MANAGER_TASK_PLAN_HPP

#include <string>
#include <vector>

#include "core/orchestrator.hpp"
#include "manager/results_log.hpp"
#include "proto/spec.pb.h"

namespace manager {

struct PlanOptions {
  std::vector<std::string> agents;
  // Only the first specs of each repository, in source order, are kept.
  // Zero keeps every spec.
  int max_specs_per_repo = 0;
  // When set, the pairs whose latest record is Done are skipped.
  const ResultsLog* resume = nullptr;
};

struct TaskPlan {
  // One task per kept spec and agent, spec by spec.
  std::vector<core::SpecTask> tasks;
  // Every kept spec and agent, including those skipped as done.
  std::vector<RecordKey> evaluated;
  size_t skipped_done = 0;
  size_t over_repo_limit = 0;
};

TaskPlan PlanTasks(const std::vector<proto::EvaluationSpec>& specs,
                   const PlanOptions& options);

}  // namespace manager

#endif
