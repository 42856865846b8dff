#include "executor/local_executor.hpp"

#include <memory>
#include <stdexcept>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace executor {

CommandResult LocalExecutor::Execute(const Command& command) {
  if (command.argv.empty()) {
    throw std::invalid_argument("Empty command");
  }
  std::string executable = util::which(command.argv[0]);
  if (executable.empty()) {
    throw std::runtime_error("Command not found: " + command.argv[0]);
  }

  util::TempDir tmp(temp_directory_);
  sandbox::ProcessOptions options;
  options.argv = command.argv;
  options.argv[0] = executable;
  options.workdir = command.workdir;
  options.env = command.env;
  options.wall_limit_millis = command.timeout.count();
  options.cancel = command.cancel;
  if (!command.stdin_data.empty()) {
    options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
    util::File::Write(options.stdin_file, command.stdin_data);
  }
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::CreateSandbox();
  sandbox::ProcessStatus status;
  {
    ThreadGuard guard(this);
    VLOG(2) << "Running " << command.argv[0] << " ("
            << command.argv.size() - 1 << " args) in " << command.workdir;
    try {
      status = sb->Run(options);
    } catch (const std::runtime_error& exc) {
      throw std::runtime_error(command.argv[0] + ": " + exc.what());
    }
  }

CommandResult result;
  result.exit_code = status.exit_code;
  result.signal = status.signal;
  result.timed_out = status.timed_out;
  result.cancelled = status.cancelled;
  result.wall_time_millis = status.wall_time_millis;
  result.stdout_data = util::File::ReadAll(options.stdout_file);
  result.stderr_data = util::File::ReadAll(options.stderr_file);
  return result;
}

LocalExecutor::LocalExecutor(std::string temp_directory, size_t max_processes)
    : temp_directory_(std::move(temp_directory)),
      max_processes_(max_processes) {
  util::File::MakeDirs(temp_directory_);
}

LocalExecutor::ThreadGuard::ThreadGuard(LocalExecutor* executor)
    : executor_(executor) {
  absl::MutexLock lck(&executor_->slots_mutex_);
  if (executor_->max_processes_ == 0) {
    executor_->running_++;
    return;
  }
  auto has_slot = [this]() {
    executor_->slots_mutex_.AssertHeld();
    return executor_->running_ < executor_->max_processes_;
  };
  executor_->slots_mutex_.Await(absl::Condition(&has_slot));
  executor_->running_++;
}

LocalExecutor::ThreadGuard::~ThreadGuard() {
  absl::MutexLock lck(&executor_->slots_mutex_);
  executor_->running_--;
}

}  // namespace executor
