#include "container/environment_manager.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/errors.hpp"

namespace container {

namespace {
// Exit codes of docker exec that may mean the container itself went away.
bool MayBeCrash(const executor::CommandResult& result) {
  return result.signal != 0 || result.exit_code >= 125;
}
}  // namespace

const char* InstanceStateName(InstanceState state) {
  switch (state) {
    case InstanceState::CREATED:
      return "Created";
    case InstanceState::RUNNING:
      return "Running";
    case InstanceState::COMPLETED:
      return "Completed";
    case InstanceState::TIMED_OUT:
      return "TimedOut";
    case InstanceState::CRASHED:
      return "Crashed";
    case InstanceState::DESTROYED:
      return "Destroyed";
  }
  return "Unknown";
}

void InstanceRegistry::Add(std::shared_ptr<Instance> instance) {
  absl::MutexLock lck(&mutex_);
  std::string name = instance->Name();
  live_[name] = std::move(instance);
}

std::shared_ptr<Instance> InstanceRegistry::Claim(const Instance* instance) {
  absl::MutexLock lck(&mutex_);
  auto it = live_.find(instance->Name());
  if (it == live_.end() || it->second.get() != instance) return nullptr;
  std::shared_ptr<Instance> claimed = std::move(it->second);
  live_.erase(it);
  return claimed;
}

std::vector<std::shared_ptr<Instance>> InstanceRegistry::Live() const {
  absl::MutexLock lck(&mutex_);
  std::vector<std::shared_ptr<Instance>> instances;
  for (const auto& entry : live_) instances.push_back(entry.second);
  return instances;
}

size_t InstanceRegistry::Size() const {
  absl::MutexLock lck(&mutex_);
  return live_.size();
}

std::shared_ptr<Instance> EnvironmentManager::Start(const ContainerSpec& spec) {
  if (cancel_ != nullptr) cancel_->ThrowIfAborted("start " + spec.name);
  std::string id;
  try {
    id = runtime_->Create(spec);
  } catch (const std::runtime_error& exc) {
    // The engine may have created the container before the call failed.
    LOG(WARNING) << "Cannot create instance " << spec.name << ": "
                 << exc.what();
    try {
      destroy_policy_.Run("remove " + spec.name,
                          [this, &spec]() { runtime_->Remove(spec.name); });
    } catch (const std::exception& remove_error) {
      throw util::FatalError(absl::StrCat("remove ", spec.name,
                                          " after a failed creation: ",
                                          remove_error.what()));
    }
    throw;
  }
  auto instance = std::make_shared<Instance>(spec.name, id);
  registry_->Add(instance);
  VLOG(1) << "Created instance " << spec.name << " (" << id << ")";
  try {
    runtime_->Start(id);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Instance " << spec.name << " did not start: "
                 << exc.what();
    Destroy(instance.get());
    throw util::EnvironmentFailure(
        absl::StrCat("start ", spec.name, ": ", exc.what()));
  }
  instance->SetState(InstanceState::RUNNING);
  return instance;
}

executor::CommandResult EnvironmentManager::Exec(
    Instance* instance, const std::string& script,
    std::chrono::milliseconds timeout, const std::string& workdir,
    const std::string& stdin_data) {
  if (cancel_ != nullptr) {
    cancel_->ThrowIfAborted("exec in " + instance->Name());
  }
  if (instance->State() != InstanceState::RUNNING) {
    throw util::EnvironmentFailure(
        absl::StrCat("instance ", instance->Name(), " is ",
                     InstanceStateName(instance->State())));
  }
  std::chrono::steady_clock::time_point deadline = instance->Deadline();
  if (deadline != std::chrono::steady_clock::time_point::max()) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      throw util::StageTimeout(
          absl::StrCat("time budget of ", instance->Name(), " exhausted"));
    }
    timeout = timeout.count() == 0 ? left : std::min(timeout, left);
  }
  ExecRequest request;
  request.container_id = instance->ContainerId();
  request.script = script;
  request.workdir = workdir;
  request.stdin_data = stdin_data;
  request.timeout = timeout;
  request.cancel = cancel_;
  executor::CommandResult result;
  try {
    result = runtime_->Exec(request);
  } catch (const std::runtime_error& exc) {
    throw util::EnvironmentFailure(
        absl::StrCat("exec in ", instance->Name(), ": ", exc.what()));
  }
  if (result.cancelled) {
    throw util::CancellationRequested("exec in " + instance->Name());
  }
  if (result.timed_out) {
    LOG(WARNING) << "Command in " << instance->Name() << " exceeded "
                 << timeout.count() << "ms, destroying the instance";
    instance->SetState(InstanceState::TIMED_OUT);
    Destroy(instance);
    throw util::StageTimeout(absl::StrCat("command in ", instance->Name(),
                                          " exceeded ", timeout.count(),
                                          "ms"));
  }
  if (MayBeCrash(result) && !runtime_->IsRunning(instance->ContainerId())) {
    LOG(WARNING) << "Instance " << instance->Name() << " crashed";
    instance->SetState(InstanceState::CRASHED);
    throw util::EnvironmentFailure(
        absl::StrCat("instance ", instance->Name(), " is no longer running"));
  }
  return result;
}

void EnvironmentManager::Destroy(Instance* instance) {
  std::shared_ptr<Instance> claimed = registry_->Claim(instance);
  if (!claimed) return;
  if (instance->State() == InstanceState::RUNNING) {
    instance->SetState(InstanceState::COMPLETED);
  }
  try {
    // Removal is not interrupted by cancellation.
    destroy_policy_.Run("remove " + instance->Name(), [this, instance]() {
      runtime_->Remove(instance->ContainerId());
    });
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Cannot remove instance " << instance->Name() << ": "
               << exc.what();
    // Keep it in the registry so that shutdown can try again.
    registry_->Add(std::move(claimed));
    throw util::FatalError(
        absl::StrCat("remove ", instance->Name(), ": ", exc.what()));
  }
  VLOG(1) << "Destroyed instance " << instance->Name() << " ("
          << InstanceStateName(instance->State()) << ")";
  instance->SetState(InstanceState::DESTROYED);
}

void EnvironmentManager::DestroyAll() {
  std::vector<std::shared_ptr<Instance>> live = registry_->Live();
  if (!live.empty()) {
    LOG(INFO) << "Destroying " << live.size() << " live instances";
  }
  std::string errors;
  for (const std::shared_ptr<Instance>& instance : live) {
    try {
      Destroy(instance.get());
    } catch (const util::FatalError& exc) {
      absl::StrAppend(&errors, errors.empty() ? "" : "; ", exc.what());
    }
  }
  if (!errors.empty()) throw util::FatalError(errors);
}

InstanceGuard::~InstanceGuard() {
  if (!instance_) return;
  try {
    manager_->Destroy(instance_.get());
  } catch (const util::FatalError& exc) {
    LOG(ERROR) << exc.what();
  }
}

void InstanceGuard::Destroy() {
  if (!instance_) return;
  std::shared_ptr<Instance> instance = std::move(instance_);
  manager_->Destroy(instance.get());
}

}  // namespace container
