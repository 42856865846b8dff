#include "util/cancellation.hpp"

#include "absl/time/time.h"
#include "util/errors.hpp"

namespace util {

void CancellationToken::RequestStop() {
  absl::MutexLock lck(&mutex_);
  stop_requested_ = true;
}

void CancellationToken::Abort() {
  absl::MutexLock lck(&mutex_);
  stop_requested_ = true;
  aborted_ = true;
}

bool CancellationToken::SleepFor(std::chrono::milliseconds timeout) const {
  absl::MutexLock lck(&mutex_);
  auto cond = [this]() { return aborted_.load(); };
  return !mutex_.AwaitWithTimeout(absl::Condition(&cond),
                                  absl::FromChrono(timeout));
}

bool CancellationToken::WaitForStop(std::chrono::milliseconds timeout) const {
  absl::MutexLock lck(&mutex_);
  auto cond = [this]() { return stop_requested_.load(); };
  return mutex_.AwaitWithTimeout(absl::Condition(&cond),
                                 absl::FromChrono(timeout));
}

void CancellationToken::ThrowIfAborted(const std::string& where) const {
  if (aborted_) throw CancellationRequested(where + ": aborted");
}

}  // namespace util
