#ifndef UTIL_RETRY_HPP
#define UTIL_RETRY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "util/cancellation.hpp"

namespace util {

// Bounded retry with an explicit backoff schedule. This is the only place
// where operations are retried.
class RetryPolicy {
 public:
  using Predicate = std::function<bool(const std::exception&)>;

  // backoff[i] is waited before attempt i + 2; the last entry is reused when
  // there are more attempts than entries.
  RetryPolicy(int max_attempts, std::vector<std::chrono::milliseconds> backoff,
              Predicate retryable)
      : max_attempts_(max_attempts < 1 ? 1 : max_attempts),
        backoff_(std::move(backoff)),
        retryable_(std::move(retryable)) {}

  // Policy that retries every std::exception.
  static RetryPolicy Always(int max_attempts,
                            std::vector<std::chrono::milliseconds> backoff);

  // Runs attempt until it does not throw, the exception is not retryable, or
  // attempts are exhausted; the last exception is rethrown. If cancel is
  // aborted during a backoff, CancellationRequested is thrown.
  void Run(const std::string& description, const std::function<void()>& attempt,
           const CancellationToken* cancel = nullptr) const;

  int MaxAttempts() const { return max_attempts_; }
  std::chrono::milliseconds BackoffBefore(int attempt) const;

 private:
  int max_attempts_;
  std::vector<std::chrono::milliseconds> backoff_;
  Predicate retryable_;
};

}  // namespace util

#endif
