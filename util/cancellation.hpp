#ifndef UTIL_CANCELLATION_HPP
#define UTIL_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace util {

// Process-wide shutdown state shared by every blocking call. A stop request
// only prevents new work from being scheduled; an abort asks in-flight work
// to return as soon as possible.
class CancellationToken {
 public:
  void RequestStop();
  void Abort();

  bool StopRequested() const { return stop_requested_; }
  bool Aborted() const { return aborted_; }

  // Sleeps for at most timeout. Returns false if the token was aborted before
  // the timeout expired.
  bool SleepFor(std::chrono::milliseconds timeout) const;

  // Blocks until a stop is requested or the timeout expires. Returns true if
  // a stop was requested.
  bool WaitForStop(std::chrono::milliseconds timeout) const;

  // Throws CancellationRequested if the token was aborted.
  void ThrowIfAborted(const std::string& where) const;

  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;
  CancellationToken(CancellationToken&&) = delete;
  CancellationToken& operator=(CancellationToken&&) = delete;

 private:
  mutable absl::Mutex mutex_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> aborted_{false};
};

}  // namespace util

#endif
