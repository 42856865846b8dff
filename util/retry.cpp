#include "util/retry.hpp"

#include <thread>

#include "glog/logging.h"
#include "util/errors.hpp"

namespace util {

RetryPolicy RetryPolicy::Always(
    int max_attempts, std::vector<std::chrono::milliseconds> backoff) {
  return RetryPolicy(max_attempts, std::move(backoff),
                     [](const std::exception&) { return true; });
}

std::chrono::milliseconds RetryPolicy::BackoffBefore(int attempt) const {
  if (attempt <= 1 || backoff_.empty()) return std::chrono::milliseconds(0);
  size_t idx = attempt - 2;
  if (idx >= backoff_.size()) idx = backoff_.size() - 1;
  return backoff_[idx];
}

void RetryPolicy::Run(const std::string& description,
                      const std::function<void()>& attempt,
                      const CancellationToken* cancel) const {
  for (int i = 1;; i++) {
    try {
      attempt();
      return;
    } catch (const CancellationRequested&) {
      throw;
    } catch (const std::exception& exc) {
      if (i >= max_attempts_ || !retryable_(exc)) throw;
      std::chrono::milliseconds wait = BackoffBefore(i + 1);
      LOG(WARNING) << description << " failed (attempt " << i << "/"
                   << max_attempts_ << "): " << exc.what() << ", retrying in "
                   << wait.count() << "ms";
      if (cancel == nullptr) {
        std::this_thread::sleep_for(wait);
      } else if (!cancel->SleepFor(wait)) {
        throw CancellationRequested(description + ": aborted during backoff");
      }
    }
  }
}

}  // namespace util
