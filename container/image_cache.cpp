#include "container/image_cache.hpp"

#include <cctype>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "util/digest.hpp"
#include "util/errors.hpp"
#include "util/file.hpp"

namespace container {

namespace {
const char* kDefaultPythonVersion = "3.11";
const auto kWaitSlice = absl::Milliseconds(200);  // NOLINT

std::string DockerQuote(const std::string& value) {
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\' || c == '$') out += '\\';
    out += c;
  }
  return out + "\"";
}

std::string CloneUrl(const std::string& repo) {
  if (absl::StrContains(repo, "://") || absl::StartsWith(repo, "git@")) {
    return repo;
  }
  return absl::StrCat("https://github.com/", repo, ".git");
}

bool Retryable(const std::exception& exc) {
  return dynamic_cast<const util::BuildTimeout*>(&exc) == nullptr;
}
}  // namespace

ImageCache::ImageCache(Runtime* runtime, ImageCacheOptions options)
    : runtime_(runtime),
      options_(std::move(options)),
      build_policy_(options_.build_attempts, options_.build_backoff,
                    Retryable) {}

std::string ImageCache::Fingerprint(const ImageRequest& request) {
  const proto::EnvironmentDescriptor& env = request.environment;
  util::Sha256 hasher;
  auto add = [&hasher](const std::string& field) {
    hasher.Update(field);
    hasher.Update(absl::string_view("\0", 1));
  };
  add(request.repo);
  add(env.base_image());
  add(env.python_version());
  for (const std::string& command : env.setup_commands()) add(command);
  add("--env--");
  std::map<std::string, std::string> sorted_env(env.env().begin(),
                                                env.env().end());
  for (const auto& var : sorted_env) {
    add(var.first);
    add(var.second);
  }
  return hasher.HexDigest();
}

std::string ImageCache::Tag(const std::string& repo,
                            const std::string& fingerprint) {
  std::string name;
  for (char c : repo) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' ||
        c == '_') {
      name += std::tolower(static_cast<unsigned char>(c));
    } else if (c == '/') {
      name += "__";
    } else {
      name += '_';
    }
  }
  return absl::StrCat("patchbench/", name, ":", fingerprint.substr(0, 12));
}

std::string ImageCache::Dockerfile(const ImageRequest& request) {
  const proto::EnvironmentDescriptor& env = request.environment;
  std::string base = env.base_image();
  if (base.empty()) {
    base = absl::StrCat("python:", env.python_version().empty()
                                       ? kDefaultPythonVersion
                                       : env.python_version());
  }
  std::string dockerfile = absl::StrCat("FROM ", base, "\n");
  std::map<std::string, std::string> sorted_env(env.env().begin(),
                                                env.env().end());
  for (const auto& var : sorted_env) {
    absl::StrAppend(&dockerfile, "ENV ", var.first, "=",
                    DockerQuote(var.second), "\n");
  }
  // The agent workspace is owned by the host user.
  absl::StrAppend(&dockerfile,
                  "RUN git config --global --add safe.directory '*'\n",
                  "RUN git clone ", CloneUrl(request.repo), " /workdir/repo\n",
                  "WORKDIR /workdir/repo\n");
  for (const std::string& command : env.setup_commands()) {
    absl::StrAppend(&dockerfile, "RUN ", command, "\n");
  }
  return dockerfile;
}

proto::CachedImage ImageCache::Acquire(const ImageRequest& request,
                                       const util::CancellationToken* cancel) {
  std::string fingerprint = Fingerprint(request);
  std::string tag = Tag(request.repo, fingerprint);
  bool check_existing = false;
  {
    absl::MutexLock lck(&mutex_);
    while (true) {
      auto it = entries_.find(fingerprint);
      if (it == entries_.end()) break;
      Entry& entry = it->second;
      if (entry.image.state() == proto::IMAGE_READY) {
        if (entry.verified) return entry.image;
        check_existing = true;
        break;
      }
      if (entry.image.state() == proto::IMAGE_FAILED) {
        if (std::chrono::steady_clock::now() - entry.failed_at <
            options_.negative_ttl) {
          VLOG(1) << "Image " << tag << " failed recently: "
                  << entry.image.error();
          if (entry.timed_out) throw util::BuildTimeout(entry.image.error());
          throw util::BuildFailure(entry.image.error());
        }
        break;
      }
      // Somebody else is building this image.
      auto not_building = [this, &fingerprint]() {
        mutex_.AssertHeld();
        auto it = entries_.find(fingerprint);
        return it == entries_.end() ||
               it->second.image.state() != proto::IMAGE_BUILDING;
      };
      mutex_.AwaitWithTimeout(absl::Condition(&not_building), kWaitSlice);
      if (cancel != nullptr) cancel->ThrowIfAborted("waiting for " + tag);
    }
    Entry& entry = entries_[fingerprint];
    entry.image.set_fingerprint(fingerprint);
    entry.image.set_repo(request.repo);
    entry.image.set_tag(tag);
    entry.image.set_state(proto::IMAGE_BUILDING);
    entry.image.clear_error();
    entry.verified = false;
    entry.timed_out = false;
  }

  auto start = std::chrono::steady_clock::now();
  std::string error;
  bool timed_out = false;
  try {
    if (!check_existing || !runtime_->HasImage(tag)) {
      Build(request, tag, cancel);
    } else {
      VLOG(1) << "Reusing persisted image " << tag;
    }
  } catch (const util::CancellationRequested&) {
    absl::MutexLock lck(&mutex_);
    entries_.erase(fingerprint);
    throw;
  } catch (const util::BuildTimeout& exc) {
    error = exc.what();
    timed_out = true;
  } catch (const std::exception& exc) {
    error = exc.what();
  }
  double seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  absl::MutexLock lck(&mutex_);
  Entry& entry = entries_[fingerprint];
  *entry.image.mutable_updated() =
      google::protobuf::util::TimeUtil::GetCurrentTime();
  if (!error.empty()) {
    LOG(ERROR) << "Image " << tag << " failed: " << error;
    entry.image.set_state(proto::IMAGE_FAILED);
    entry.image.set_error(error);
    entry.failed_at = std::chrono::steady_clock::now();
    entry.timed_out = timed_out;
    if (timed_out) throw util::BuildTimeout(error);
    throw util::BuildFailure(error);
  }
  if (!check_existing) entry.image.set_build_seconds(seconds);
  entry.image.set_state(proto::IMAGE_READY);
  entry.verified = true;
  proto::CachedImage ready = entry.image;
  // A new environment for the same repository supersedes the old image.
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first != fingerprint && it->second.image.repo() == request.repo &&
        it->second.image.state() != proto::IMAGE_BUILDING) {
      VLOG(1) << "Dropping superseded image " << it->second.image.tag();
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  Persist();
  return ready;
}

void ImageCache::Build(const ImageRequest& request, const std::string& tag,
                       const util::CancellationToken* cancel) {
  std::string dockerfile = Dockerfile(request);
  build_policy_.Run(
      "build " + tag,
      [this, &tag, &dockerfile, cancel]() {
        runtime_->BuildImage(tag, dockerfile, options_.build_timeout, cancel);
      },
      cancel);
  LOG(INFO) << "Image " << tag << " is ready";
}

void ImageCache::Setup() {
  if (options_.store_directory.empty()) return;
  util::File::MakeDirs(options_.store_directory);
  path_ = util::File::JoinPath(options_.store_directory, "images.pb");
  if (util::File::Size(path_) < 0) return;
  proto::ImageStore store;
  if (!store.ParseFromString(util::File::ReadAll(path_))) {
    LOG(WARNING) << "Ignoring corrupted image store " << path_;
    return;
  }
  absl::MutexLock lck(&mutex_);
  for (const proto::CachedImage& image : store.image()) {
    if (image.state() != proto::IMAGE_READY) continue;
    Entry& entry = entries_[image.fingerprint()];
    entry.image = image;
    entry.verified = false;
  }
  LOG(INFO) << "Loaded " << entries_.size() << " images from " << path_;
}

void ImageCache::TearDown() {
  absl::MutexLock lck(&mutex_);
  Persist();
}

void ImageCache::Persist() {
  if (path_.empty()) return;
  proto::ImageStore store;
  for (const auto& entry : entries_) {
    if (entry.second.image.state() != proto::IMAGE_READY) continue;
    *store.add_image() = entry.second.image;
  }
  try {
    util::File::Write(path_, store.SerializeAsString());
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot persist image store: " << exc.what();
  }
}

}  // namespace container
