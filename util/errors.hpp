#ifndef UTIL_ERRORS_HPP
#define UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace util {

// Image build failed. May be retried.
class BuildFailure : public std::runtime_error {
 public:
  explicit BuildFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// Image build exceeded its ceiling. Never retried.
class BuildTimeout : public std::runtime_error {
 public:
  explicit BuildTimeout(const std::string& msg) : std::runtime_error(msg) {}
};

// The container could not be started or died independently of the agent.
class EnvironmentFailure : public std::runtime_error {
 public:
  explicit EnvironmentFailure(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A stage exceeded its time budget.
class StageTimeout : public std::runtime_error {
 public:
  explicit StageTimeout(const std::string& msg) : std::runtime_error(msg) {}
};

// A stop or abort was requested while waiting.
class CancellationRequested : public std::runtime_error {
 public:
  explicit CancellationRequested(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Results could not be persisted or a resource could not be released.
class FatalError : public std::runtime_error {
 public:
  explicit FatalError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace util

#endif
