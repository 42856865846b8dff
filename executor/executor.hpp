#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <chrono>
#include <string>
#include <vector>

#include "util/cancellation.hpp"

namespace executor {

// A host command. argv[0] is looked up in $PATH.
struct Command {
  std::vector<std::string> argv;
  std::string workdir = ".";
  std::string stdin_data;
  // Extra environment variables, in NAME=value form.
  std::vector<std::string> env;
  // Zero means no wall clock limit.
  std::chrono::milliseconds timeout{0};
  const util::CancellationToken* cancel = nullptr;
};

struct CommandResult {
  int32_t exit_code = 0;
  int32_t signal = 0;
  std::string stdout_data;
  std::string stderr_data;
  bool timed_out = false;
  bool cancelled = false;
  int64_t wall_time_millis = 0;

  bool Success() const {
    return exit_code == 0 && signal == 0 && !timed_out && !cancelled;
  }
};

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the command to completion. Throws std::runtime_error if the command
  // could not be started.
  virtual CommandResult Execute(const Command& command) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
