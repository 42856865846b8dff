#include "container/workspace.hpp"

#include <unistd.h>

#include <system_error>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace container {

const char InstanceWorkspace::kBaseDir[] = "/workdir/repo";
const char InstanceWorkspace::kCandidateDir[] = "/workdir/repo_post";
const char InstanceWorkspace::kReferenceDir[] = "/workdir/repo_gold";
const char InstanceWorkspace::kAgentDir[] = "/workspace";

InstanceWorkspace::InstanceWorkspace(EnvironmentManager* manager,
                                     Instance* instance, std::string host_dir,
                                     std::chrono::milliseconds timeout)
    : manager_(manager),
      instance_(instance),
      host_dir_(std::move(host_dir)),
      timeout_(timeout),
      base_(manager, instance, kBaseDir, timeout),
      candidate_(manager, instance, kCandidateDir, timeout),
      reference_(manager, instance, kReferenceDir, timeout) {}

std::string InstanceWorkspace::Run(const std::string& what,
                                   const std::string& script,
                                   const std::string& workdir) {
  executor::CommandResult result =
      manager_->Exec(instance_, script, timeout_, workdir);
  if (!result.Success()) {
    throw util::EnvironmentFailure(
        absl::StrCat(what, " in ", instance_->Name(), " failed with status ",
                     result.exit_code, ": ", result.stderr_data));
  }
  return result.stdout_data;
}

void InstanceWorkspace::Checkout(const std::string& commit) {
  Run("checkout " + commit,
      absl::StrCat("git reset -q --hard && git clean -q -fd && ",
                   "git checkout -q ", util::ShellQuote(commit)),
      kBaseDir);
}

namespace {
// Hands path back to the user running patchbench.
std::string ChownToHostUser(const std::string& path) {
  return absl::StrCat("chown -R ", getuid(), ":", getgid(), " ", path);
}
}  // namespace

void InstanceWorkspace::PrepareAgentWorkspace() {
  // The copy is made by root; an agent running on the host must be able to
  // write it.
  Run("prepare agent workspace",
      absl::StrCat("cp -a ", kBaseDir, "/. ", kAgentDir, "/ && ",
                   ChownToHostUser(kAgentDir)),
      kAgentDir);
}

std::string InstanceWorkspace::CapturePatch() {
  return Run("capture patch", "git add -A && git diff --cached", kAgentDir);
}

void InstanceWorkspace::Fork(const std::string& dir) {
  Run("copy base tree to " + dir,
      absl::StrCat("rm -rf ", dir, " && cp -a ", kBaseDir, " ", dir), "/");
}

void InstanceWorkspace::ForkCandidate() { Fork(kCandidateDir); }

void InstanceWorkspace::ForkReference() { Fork(kReferenceDir); }

void InstanceWorkspace::Release() {
  if (instance_->State() == InstanceState::RUNNING) {
    try {
      Run("release agent workspace", ChownToHostUser(kAgentDir), "/");
    } catch (const util::FatalError&) {
      throw;
    } catch (const std::runtime_error& exc) {
      LOG(WARNING) << exc.what();
    }
  }
  try {
    util::File::RemoveTree(host_dir_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot remove " << host_dir_ << ": " << exc.what();
  }
}

}  // namespace container
