#include "container/docker_runtime.hpp"

#include <sstream>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/errors.hpp"

namespace container {

namespace {
const auto kControlTimeout = std::chrono::seconds(120);  // NOLINT

// The last part of a (possibly huge) build log.
std::string Tail(const std::string& text, size_t max_size = 2000) {
  if (text.size() <= max_size) return text;
  return "..." + text.substr(text.size() - max_size);
}

std::string FormatCpus(double cpus) {
  std::ostringstream out;
  out << cpus;
  return out.str();
}
}  // namespace

executor::CommandResult DockerRuntime::Run(
    std::vector<std::string> args, std::chrono::milliseconds timeout,
    const std::string& stdin_data, const util::CancellationToken* cancel) {
  executor::Command command;
  command.argv.reserve(args.size() + 1);
  command.argv.push_back(binary_);
  for (std::string& arg : args) command.argv.push_back(std::move(arg));
  command.timeout = timeout;
  command.stdin_data = stdin_data;
  command.cancel = cancel;
  return executor_->Execute(command);
}

bool DockerRuntime::HasImage(const std::string& tag) {
  executor::CommandResult result =
      Run({"image", "inspect", "--format", "{{.Id}}", tag}, kControlTimeout);
  return result.Success();
}

void DockerRuntime::BuildImage(const std::string& tag,
                               const std::string& dockerfile,
                               std::chrono::milliseconds timeout,
                               const util::CancellationToken* cancel) {
  LOG(INFO) << "Building image " << tag;
  executor::CommandResult result;
  try {
    // The Dockerfile is read from stdin, without a build context.
    result = Run({"build", "--network", "host", "-t", tag, "-"}, timeout,
                 dockerfile, cancel);
  } catch (const std::runtime_error& exc) {
    throw util::BuildFailure(absl::StrCat("docker build ", tag, ": ",
                                          exc.what()));
  }
  if (result.cancelled) {
    throw util::CancellationRequested("docker build " + tag);
  }
  if (result.timed_out) {
    throw util::BuildTimeout(absl::StrCat("docker build ", tag,
                                          " did not finish in ",
                                          timeout.count() / 1000, "s"));
  }
  if (!result.Success()) {
    throw util::BuildFailure(absl::StrCat("docker build ", tag, " exited with ",
                                          result.exit_code, ": ",
                                          Tail(result.stderr_data)));
  }
}

std::vector<std::string> DockerRuntime::CreateArgs(const ContainerSpec& spec) {
  std::vector<std::string> args = {"create", "--init"};
  if (!spec.name.empty()) {
    args.push_back("--name");
    args.push_back(spec.name);
  }
  if (spec.limits.cpus > 0) {
    args.push_back("--cpus");
    args.push_back(FormatCpus(spec.limits.cpus));
  }
  if (spec.limits.memory_mb > 0) {
    args.push_back("--memory");
    args.push_back(absl::StrCat(spec.limits.memory_mb, "m"));
  }
  if (!spec.limits.gpus.empty()) {
    args.push_back("--gpus");
    args.push_back(spec.limits.gpus);
  }
  if (!spec.limits.network.empty()) {
    args.push_back("--network");
    args.push_back(spec.limits.network);
  }
  for (const Mount& mount : spec.mounts) {
    args.push_back("-v");
    args.push_back(absl::StrCat(mount.host_path, ":", mount.container_path,
                                mount.read_only ? ":ro" : ""));
  }
  for (const std::string& var : spec.env) {
    args.push_back("-e");
    args.push_back(var);
  }
  args.push_back(spec.image);
  // Keep the container alive; every command is run through exec.
  args.push_back("sleep");
  args.push_back("infinity");
  return args;
}

std::string DockerRuntime::Create(const ContainerSpec& spec) {
  executor::CommandResult result;
  try {
    result = Run(CreateArgs(spec), kControlTimeout);
  } catch (const std::runtime_error& exc) {
    throw util::EnvironmentFailure(exc.what());
  }
  std::string id(absl::StripAsciiWhitespace(result.stdout_data));
  if (!result.Success() || id.empty()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "docker create ", spec.name, ": ", Tail(result.stderr_data)));
  }
  return id;
}

void DockerRuntime::Start(const std::string& container_id) {
  executor::CommandResult result;
  try {
    result = Run({"start", container_id}, kControlTimeout);
  } catch (const std::runtime_error& exc) {
    throw util::EnvironmentFailure(exc.what());
  }
  if (!result.Success()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "docker start ", container_id, ": ", Tail(result.stderr_data)));
  }
}

executor::CommandResult DockerRuntime::Exec(const ExecRequest& request) {
  std::vector<std::string> args = {"exec"};
  if (!request.stdin_data.empty()) args.push_back("-i");
  if (!request.workdir.empty()) {
    args.push_back("-w");
    args.push_back(request.workdir);
  }
  args.push_back(request.container_id);
  args.push_back("sh");
  args.push_back("-c");
  args.push_back(request.script);
  return Run(std::move(args), request.timeout, request.stdin_data,
             request.cancel);
}

bool DockerRuntime::IsRunning(const std::string& container_id) {
  executor::CommandResult result =
      Run({"inspect", "--format", "{{.State.Running}}", container_id},
          kControlTimeout);
  return result.Success() &&
         absl::StripAsciiWhitespace(result.stdout_data) == "true";
}

void DockerRuntime::Remove(const std::string& container_id) {
  executor::CommandResult result =
      Run({"rm", "-f", "-v", container_id}, kControlTimeout);
  if (result.Success()) return;
  if (absl::StrContains(result.stderr_data, "No such container")) return;
  throw std::runtime_error(absl::StrCat("docker rm ", container_id, ": ",
                                        Tail(result.stderr_data)));
}

}  // namespace container
