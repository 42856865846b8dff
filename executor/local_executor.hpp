#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs commands as child processes of the orchestrator, in the sandbox.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  CommandResult Execute(const Command& command) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

  // At most max_processes commands run at the same time; further calls wait
  // for a slot. Zero means no limit.
  explicit LocalExecutor(std::string temp_directory, size_t max_processes = 0);

 private:
  class ThreadGuard {
   public:
    explicit ThreadGuard(LocalExecutor* executor);
    ~ThreadGuard();
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&&) = delete;
    ThreadGuard& operator=(ThreadGuard&&) = delete;

   private:
    LocalExecutor* executor_;
  };

  std::string temp_directory_;
  size_t max_processes_;
  absl::Mutex slots_mutex_;
  size_t running_ GUARDED_BY(slots_mutex_) = 0;
};

}  // namespace executor

#endif
