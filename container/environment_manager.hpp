#ifndef CONTAINER_ENVIRONMENT_MANAGER_HPP
#define CONTAINER_ENVIRONMENT_MANAGER_HPP

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "container/runtime.hpp"
#include "util/cancellation.hpp"
#include "util/retry.hpp"

namespace container {

enum class InstanceState {
  CREATED,
  RUNNING,
  COMPLETED,
  TIMED_OUT,
  CRASHED,
  DESTROYED
};

const char* InstanceStateName(InstanceState state);

// A container started for one spec attempt.
class Instance {
 public:
  const std::string& Name() const { return name_; }
  const std::string& ContainerId() const { return container_id_; }
  InstanceState State() const {
    absl::MutexLock lck(&mutex_);
    return state_;
  }

  // Commands run in the instance are cut at the deadline; once it has passed
  // they are refused with util::StageTimeout.
  void SetDeadline(std::chrono::steady_clock::time_point deadline) {
    absl::MutexLock lck(&mutex_);
    deadline_ = deadline;
  }
  void ClearDeadline() {
    SetDeadline(std::chrono::steady_clock::time_point::max());
  }
  std::chrono::steady_clock::time_point Deadline() const {
    absl::MutexLock lck(&mutex_);
    return deadline_;
  }

  Instance(std::string name, std::string container_id)
      : name_(std::move(name)), container_id_(std::move(container_id)) {}
  Instance(const Instance&) = delete;
  Instance& operator=(const Instance&) = delete;

 private:
  friend class EnvironmentManager;
  void SetState(InstanceState state) {
    absl::MutexLock lck(&mutex_);
    if (state_ != InstanceState::DESTROYED) state_ = state;
  }

  std::string name_;
  std::string container_id_;
  mutable absl::Mutex mutex_;
  InstanceState state_ GUARDED_BY(mutex_) = InstanceState::CREATED;
  std::chrono::steady_clock::time_point deadline_ GUARDED_BY(mutex_) =
      std::chrono::steady_clock::time_point::max();
};

// Table of the instances that still have to be destroyed. Owned by whoever
// drives the evaluation and shared by all the environment managers.
class InstanceRegistry {
 public:
  void Add(std::shared_ptr<Instance> instance);

  // Removes the instance from the table and returns it, or returns null if
  // it was not there. The caller is then responsible for destroying it.
  std::shared_ptr<Instance> Claim(const Instance* instance);

  std::vector<std::shared_ptr<Instance>> Live() const;
  size_t Size() const;

 private:
  mutable absl::Mutex mutex_;
  std::map<std::string, std::shared_ptr<Instance>> live_ GUARDED_BY(mutex_);
};

// Starts, runs commands in and destroys containers. Every started instance is
// in the registry until it is destroyed.
class EnvironmentManager {
 public:
  EnvironmentManager(Runtime* runtime, InstanceRegistry* registry,
                     util::RetryPolicy destroy_policy,
                     const util::CancellationToken* cancel)
      : runtime_(runtime),
        registry_(registry),
        destroy_policy_(std::move(destroy_policy)),
        cancel_(cancel) {}

  // Creates and starts a container. Throws util::EnvironmentFailure; nothing
  // is left running in that case. A container that could not be removed
  // after a failed creation is a util::FatalError.
  std::shared_ptr<Instance> Start(const ContainerSpec& spec);

  // Runs script with sh -c, for at most timeout or until the instance
  // deadline. On timeout the instance is marked TimedOut and destroyed, then
  // util::StageTimeout is thrown. If the container died the
  // instance is marked Crashed and util::EnvironmentFailure is thrown.
  // util::CancellationRequested is thrown if the token is aborted.
  executor::CommandResult Exec(Instance* instance, const std::string& script,
                               std::chrono::milliseconds timeout,
                               const std::string& workdir = "",
                               const std::string& stdin_data = "");

  // Removes the container. Calling it again, or concurrently, is a no-op.
  // Throws util::FatalError if the container could not be removed; the
  // instance is then put back in the registry.
  void Destroy(Instance* instance);

  // Destroys everything in the registry. Throws util::FatalError if some
  // instance could not be removed.
  void DestroyAll();

  EnvironmentManager(const EnvironmentManager&) = delete;
  EnvironmentManager& operator=(const EnvironmentManager&) = delete;

 private:
  Runtime* runtime_;
  InstanceRegistry* registry_;
  util::RetryPolicy destroy_policy_;
  const util::CancellationToken* cancel_;
};

// Destroys the instance when it goes out of scope.
class InstanceGuard {
 public:
  InstanceGuard(EnvironmentManager* manager, std::shared_ptr<Instance> instance)
      : manager_(manager), instance_(std::move(instance)) {}
  ~InstanceGuard();

  Instance* Get() const { return instance_.get(); }
  Instance* operator->() const { return instance_.get(); }

  // Destroys the instance now, propagating errors.
  void Destroy();

  InstanceGuard(const InstanceGuard&) = delete;
  InstanceGuard& operator=(const InstanceGuard&) = delete;

 private:
  EnvironmentManager* manager_;
  std::shared_ptr<Instance> instance_;
};

}  // namespace container

#endif
