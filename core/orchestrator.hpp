#ifndef CORE_ORCHESTRATOR_HPP
#define CORE_ORCHESTRATOR_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "proto/result.pb.h"
#include "proto/spec.pb.h"
#include "util/cancellation.hpp"

namespace core {

// One spec evaluated with one agent.
struct SpecTask {
  proto::EvaluationSpec spec;
  // Position of the spec in its source.
  int64_t sequence = 0;
  // Name of the agent to evaluate.
  std::string agent;
};

// Evaluates one task from start to finish.
class SpecProcessor {
 public:
  // Returns the terminal record of the task. Stage failures and cancellation
  // are reported in the record; only util::FatalError is thrown.
  virtual proto::ResultRecord Process(const SpecTask& task) = 0;

  SpecProcessor() = default;
  virtual ~SpecProcessor() = default;
  SpecProcessor(const SpecProcessor&) = delete;
  SpecProcessor& operator=(const SpecProcessor&) = delete;
  SpecProcessor(SpecProcessor&&) = delete;
  SpecProcessor& operator=(SpecProcessor&&) = delete;
};

struct RunSummary {
  size_t completed = 0;
  // Specs left unscheduled because a stop was requested.
  size_t not_started = 0;
};

class Orchestrator {
 public:
  using RecordCallback = std::function<void(const proto::ResultRecord&)>;

  Orchestrator(SpecProcessor* processor, int concurrency,
               const util::CancellationToken* cancel)
      : processor_(processor),
        concurrency_(concurrency < 1 ? 1 : concurrency),
        cancel_(cancel) {}

  // Processes the tasks in order, at most concurrency at a time, and passes
  // every record to callback. Once a stop is requested no further task is
  // started. If the processor or the callback throws util::FatalError no
  // further task is started either, and the error is rethrown when the
  // running tasks are over.
  RunSummary Run(const std::vector<SpecTask>& tasks,
                 const RecordCallback& callback);

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

 private:
  void ThreadBody(const RecordCallback& callback);

  SpecProcessor* processor_;
  int concurrency_;
  const util::CancellationToken* cancel_;

  std::queue<const SpecTask*> tasks_;
  std::mutex task_mutex_;
  std::atomic<bool> quitting_{false};
  std::atomic<size_t> completed_{0};
  size_t total_ = 0;
  std::exception_ptr fatal_error_;
};

}  // namespace core

#endif
