#ifndef CONTAINER_IMAGE_CACHE_HPP
#define CONTAINER_IMAGE_CACHE_HPP

#include <chrono>
#include <map>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "container/runtime.hpp"
#include "proto/image_store.pb.h"
#include "proto/spec.pb.h"
#include "util/cancellation.hpp"
#include "util/retry.hpp"

namespace container {

struct ImageRequest {
  std::string repo;
  proto::EnvironmentDescriptor environment;
};

struct ImageCacheOptions {
  // Where images.pb is kept. Empty disables persistence.
  std::string store_directory;
  std::chrono::milliseconds build_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds negative_ttl{std::chrono::minutes(5)};
  int build_attempts = 2;
  std::vector<std::chrono::milliseconds> build_backoff = {
      std::chrono::seconds(10)};
};

// Maps (repository, environment) fingerprints to built images. At most one
// build per fingerprint is in flight; other callers wait for it. Failures are
// remembered for negative_ttl.
class ImageCache {
 public:
  ImageCache(Runtime* runtime, ImageCacheOptions options);

  // Returns a Ready image for the request, building it if needed. Throws
  // util::BuildFailure, util::BuildTimeout or util::CancellationRequested.
  proto::CachedImage Acquire(const ImageRequest& request,
                             const util::CancellationToken* cancel);

  // Loads the persisted store.
  void Setup();

  // Persists the store.
  void TearDown();

  static std::string Fingerprint(const ImageRequest& request);
  static std::string Tag(const std::string& repo,
                         const std::string& fingerprint);
  static std::string Dockerfile(const ImageRequest& request);

  ImageCache(const ImageCache&) = delete;
  ImageCache& operator=(const ImageCache&) = delete;
  ImageCache(ImageCache&&) = delete;
  ImageCache& operator=(ImageCache&&) = delete;

 private:
  struct Entry {
    proto::CachedImage image;
    // Entries loaded from disk are checked against the runtime before use.
    bool verified = false;
    bool timed_out = false;
    std::chrono::steady_clock::time_point failed_at;
  };

  void Build(const ImageRequest& request, const std::string& tag,
             const util::CancellationToken* cancel);
  void Persist() EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  Runtime* runtime_;
  ImageCacheOptions options_;
  util::RetryPolicy build_policy_;
  std::string path_;

  absl::Mutex mutex_;
  std::map<std::string, Entry> entries_ GUARDED_BY(mutex_);
};

}  // namespace container

#endif
