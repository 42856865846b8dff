#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the child in its own session, so that terminal signals are not
// delivered to it and a kill reaches every process it spawned.
class UnixSandbox : public Sandbox {
 public:
  ProcessStatus Run(const ProcessOptions& options) override;

 private:
  // Builds argv and the environment, and opens the pipe used by the child to
  // report a failed setup.
  void Prepare();

  // Forks and stores the PID of the child, which runs Child.
  void Fork();

  [[noreturn]] void Child();

  // Waits for the child, killing its session on timeout or cancellation.
  // Throws if the child reported a setup error.
  ProcessStatus Wait();

  const ProcessOptions* options_ = nullptr;
  int error_pipe_[2] = {-1, -1};
  pid_t child_pid_ = 0;

  // Prepared before fork, so that the child does not allocate.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> env_;
};

}  // namespace sandbox
#endif
