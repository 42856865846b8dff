#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

extern char** environ;

namespace sandbox {

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr auto kPollInterval = std::chrono::milliseconds(10);

const char* ErrorString(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string SystemError(const std::string& call) {
  char buf[kStrErrorBufSize] = {};
  return call + ": " + ErrorString(errno, buf, kStrErrorBufSize);
}

void AddCString(const std::string& s, std::vector<std::vector<char>>* storage) {
  storage->emplace_back(s.begin(), s.end());
  storage->back().push_back(0);
}

std::string VariableName(const std::string& entry) {
  return entry.substr(0, entry.find('='));
}

}  // namespace

ProcessStatus UnixSandbox::Run(const ProcessOptions& options) {
  if (options.argv.empty()) throw std::invalid_argument("Empty argv");
  options_ = &options;
  Prepare();
  Fork();
  return Wait();
}

void UnixSandbox::Prepare() {
  if (pipe2(error_pipe_, O_CLOEXEC) == -1) {
    throw std::runtime_error(SystemError("pipe2"));
  }

  arg_storage_.clear();
  args_.clear();
  for (const std::string& arg : options_->argv) AddCString(arg, &arg_storage_);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  std::set<std::string> overridden;
  for (const std::string& var : options_->env) {
    overridden.insert(VariableName(var));
  }
  env_storage_.clear();
  env_.clear();
  for (char** var = environ; var != nullptr && *var != nullptr; var++) {
    std::string entry = *var;
    if (overridden.count(VariableName(entry))) continue;
    AddCString(entry, &env_storage_);
  }
  for (const std::string& var : options_->env) AddCString(var, &env_storage_);
  for (std::vector<char>& var : env_storage_) env_.push_back(var.data());
  env_.push_back(nullptr);
}

void UnixSandbox::Fork() {
  pid_t pid = fork();
  if (pid == -1) {
    std::string error = SystemError("fork");
    close(error_pipe_[0]);
    close(error_pipe_[1]);
    throw std::runtime_error(error);
  }
  if (pid == 0) Child();
  child_pid_ = pid;
}

void UnixSandbox::Child() {
  close(error_pipe_[0]);
  // Only async-signal-safe calls from here on.
  auto die = [this](const char* call, int err) {
    char msg[kStrErrorBufSize + 64] = {};
    char buf[kStrErrorBufSize] = {};
    strncat(msg, call, 60);
    strcat(msg, ": ");
    strncat(msg, ErrorString(err, buf, kStrErrorBufSize), kStrErrorBufSize);
    int len = strlen(msg);
    if (write(error_pipe_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(error_pipe_[1], msg, len);
    }
    _Exit(127);
  };

  if (setsid() == -1) die("setsid", errno);

  // The orchestrator blocks termination signals in its threads.
  sigset_t no_signals;
  sigemptyset(&no_signals);
  if (sigprocmask(SIG_SETMASK, &no_signals, nullptr) == -1) {
    die("sigprocmask", errno);
  }

  const char* stdin_path = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int stdin_fd = open(stdin_path, O_RDONLY);
  if (stdin_fd == -1) die("open", errno);
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("dup2 stdin", errno);

  auto redirect = [&die](const std::string& path, int target) {
    if (path.empty()) return;
    int fd = creat(path.c_str(), S_IRUSR | S_IWUSR);
    if (fd == -1) die("creat", errno);
    if (dup2(fd, target) == -1) die("dup2", errno);
  };
  redirect(options_->stdout_file, STDOUT_FILENO);
  redirect(options_->stderr_file, STDERR_FILENO);

  if (chdir(options_->workdir.c_str()) == -1) die("chdir", errno);

  // The executable may still be open for writing by a concurrent copy.
  int attempts = 0;
  do {
    execve(args_[0], args_.data(), env_.data());
    usleep(100);
  } while (errno == ETXTBSY && attempts++ < 16);
  die("exec", errno);
  _Exit(127);
}

ProcessStatus UnixSandbox::Wait() {
  close(error_pipe_[1]);
  int error_len = 0;
  if (read(error_pipe_[0], &error_len, sizeof(error_len)) ==
      sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(error_pipe_[0], error, error_len) < 0) error[0] = 0;
    close(error_pipe_[0]);
    waitpid(child_pid_, nullptr, 0);
    throw std::runtime_error(error);
  }
  close(error_pipe_[0]);

  ProcessStatus status;
  auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  int child_status = 0;
  bool exited = false;
  while (!exited) {
    pid_t ret = waitpid(child_pid_, &child_status, WNOHANG);
    if (ret == -1 && errno != EINTR) {
      std::string error = SystemError("waitpid");
      kill(-child_pid_, SIGKILL);
      waitpid(child_pid_, nullptr, 0);
      throw std::runtime_error(error);
    }
    if (ret == child_pid_) {
      exited = true;
    } else if (options_->wall_limit_millis &&
               elapsed_millis() >= options_->wall_limit_millis) {
      status.timed_out = true;
      break;
    } else if (options_->cancel && options_->cancel->Aborted()) {
      status.cancelled = true;
      break;
    } else {
      std::this_thread::sleep_for(kPollInterval);
    }
  }
  if (!exited) {
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      kill(child_pid_, SIGKILL);
    }
    pid_t ret = 0;
    do {
      ret = waitpid(child_pid_, &child_status, 0);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) throw std::runtime_error(SystemError("waitpid"));
  }
  status.exit_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  status.signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  status.wall_time_millis = elapsed_millis();
  return status;
}

}  // namespace sandbox
