#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <memory>
#include <string>
#include <vector>

#include "util/cancellation.hpp"

namespace sandbox {

// A host process to run. argv[0] must be the path of the executable.
struct ProcessOptions {
  std::vector<std::string> argv;
  std::string workdir = "/";
  // Added to the parent environment, replacing variables with the same name.
  // Entries are in NAME=value form.
  std::vector<std::string> env;

  // An empty stdin_file reads /dev/null; empty output files are inherited.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;

  // Zero means no limit.
  int64_t wall_limit_millis = 0;
  // When aborted, every process of the child's session is killed.
  const util::CancellationToken* cancel = nullptr;
};

struct ProcessStatus {
  int32_t exit_code = 0;
  int32_t signal = 0;
  int64_t wall_time_millis = 0;
  bool timed_out = false;
  bool cancelled = false;
};

// Runs host processes for the local executor. An instance runs one process
// at a time.
class Sandbox {
 public:
  // Runs the process to completion. Throws std::runtime_error if it could not
  // be started, with the name of the failing call and its error.
  virtual ProcessStatus Run(const ProcessOptions& options) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

// The sandbox for the current platform.
std::unique_ptr<Sandbox> CreateSandbox();

}  // namespace sandbox

#endif
