#include "container/instance_tree.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace container {

namespace {
// Exit status of the read script when the file does not exist.
const int kMissing = 3;
}  // namespace

executor::CommandResult InstanceTree::Run(const std::string& what,
                                          const std::string& script,
                                          const std::string& stdin_data) {
  VLOG(2) << what << " in " << instance_->Name() << ":" << root_ << ": "
          << script;
  return manager_->Exec(instance_, script, timeout_, root_, stdin_data);
}

absl::optional<std::string> InstanceTree::ReadFile(const std::string& path) {
  std::string quoted = util::ShellQuote(path);
  executor::CommandResult result =
      Run("read", absl::StrCat("if [ -f ", quoted, " ]; then cat ", quoted,
                               "; else exit ", kMissing, "; fi"));
  if (result.exit_code == kMissing) return absl::nullopt;
  if (!result.Success()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "cannot read ", path, " in ", instance_->Name(), ": ",
        result.stderr_data));
  }
  return result.stdout_data;
}

void InstanceTree::WriteFile(const std::string& path,
                             const std::string& content) {
  std::string dir = util::File::BaseDir(path);
  executor::CommandResult result = Run(
      "write",
      absl::StrCat("mkdir -p ", util::ShellQuote(dir), " && cat > ",
                   util::ShellQuote(path)),
      content);
  if (!result.Success()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "cannot write ", path, " in ", instance_->Name(), ": ",
        result.stderr_data));
  }
}

void InstanceTree::RemoveFile(const std::string& path) {
  executor::CommandResult result =
      Run("remove", "rm -f " + util::ShellQuote(path));
  if (!result.Success()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "cannot remove ", path, " in ", instance_->Name(), ": ",
        result.stderr_data));
  }
}

std::vector<std::string> InstanceTree::ListFiles() {
  executor::CommandResult result =
      Run("list", "git ls-files -co --exclude-standard");
  if (!result.Success()) {
    throw util::EnvironmentFailure(absl::StrCat(
        "cannot list files of ", root_, " in ", instance_->Name(), ": ",
        result.stderr_data));
  }
  return util::SplitLines(result.stdout_data);
}

}  // namespace container
