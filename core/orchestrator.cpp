#include "core/orchestrator.hpp"

#include <algorithm>
#include <functional>
#include <thread>

#include "glog/logging.h"
#include "util/errors.hpp"

namespace core {

void Orchestrator::ThreadBody(const RecordCallback& callback) {
  while (!quitting_) {
    const SpecTask* task = nullptr;
    {
      std::lock_guard<std::mutex> lck(task_mutex_);
      if (tasks_.empty()) break;
      if (cancel_ != nullptr && cancel_->StopRequested()) break;
      task = tasks_.front();
      tasks_.pop();
    }
    try {
      proto::ResultRecord record = processor_->Process(*task);
      callback(record);
      size_t completed = ++completed_;
      LOG(INFO) << "[" << completed << "/" << total_ << "] "
                << record.instance_id() << " (" << record.agent() << "): "
                << proto::SpecState_Name(record.state()) << " "
                << proto::Verdict_Name(record.verdict());
    } catch (const util::FatalError& exc) {
      LOG(ERROR) << "Fatal error while processing "
                 << task->spec.instance_id() << ": " << exc.what();
      std::lock_guard<std::mutex> lck(task_mutex_);
      if (!fatal_error_) fatal_error_ = std::current_exception();
      quitting_ = true;
    }
  }
}

RunSummary Orchestrator::Run(const std::vector<SpecTask>& tasks,
                             const RecordCallback& callback) {
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    tasks_ = std::queue<const SpecTask*>();
    for (const SpecTask& task : tasks) tasks_.push(&task);
    total_ = tasks.size();
    fatal_error_ = nullptr;
  }
  quitting_ = false;
  completed_ = 0;

  size_t num_threads = std::min<size_t>(concurrency_, tasks.size());
  LOG(INFO) << "Evaluating " << tasks.size() << " specs with " << num_threads
            << " workers";
  std::vector<std::thread> threads(num_threads);
  for (size_t i = 0; i < num_threads; i++) {
    threads[i] =
        std::thread(&Orchestrator::ThreadBody, this, std::cref(callback));
  }
  for (std::thread& thread : threads) thread.join();

  RunSummary summary;
  summary.completed = completed_;
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    summary.not_started = tasks_.size();
    tasks_ = std::queue<const SpecTask*>();
    if (fatal_error_) std::rethrow_exception(fatal_error_);
  }
  if (summary.not_started > 0) {
    LOG(WARNING) << summary.not_started << " specs were not started";
  }
  return summary;
}

}  // namespace core
