#include "manager/results_log.hpp"

#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <system_error>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/errors.hpp"
#include "util/file.hpp"

namespace manager {

namespace {

util::FatalError OsError(const std::string& what, const std::string& path) {
  return util::FatalError(
      absl::StrCat(what, " ", path, ": ", strerror(errno)));
}

bool ParseRecord(const std::string& line, proto::ResultRecord* record) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(line, record, options)
      .ok();
}

}  // namespace

ResultsLog::~ResultsLog() {
  absl::MutexLock lck(&mutex_);
  if (fd_ != -1) close(fd_);
}

std::string ResultsLog::Serialize(const proto::ResultRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw util::FatalError("serialize record of " + record.instance_id() +
                           ": " + status.ToString());
  }
  return json;
}

void ResultsLog::Load() {
  records_.clear();
  if (util::File::Size(path_) < 0) return;
  std::string content;
  try {
    content = util::File::ReadAll(path_);
  } catch (const std::system_error& exc) {
    throw util::FatalError(absl::StrCat("read ", path_, ": ", exc.what()));
  }
  size_t start = 0;
  size_t line_number = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    line_number++;
    if (end == std::string::npos) {
      LOG(WARNING) << path_ << ":" << line_number
                   << ": dropping truncated record";
      if (truncate(path_.c_str(), start) == -1) {
        throw OsError("truncate", path_);
      }
      break;
    }
    std::string line = content.substr(start, end - start);
    start = end + 1;
    if (line.empty()) continue;
    proto::ResultRecord record;
    if (!ParseRecord(line, &record)) {
      LOG(WARNING) << path_ << ":" << line_number << ": unreadable record";
      continue;
    }
    records_.push_back(std::move(record));
  }
}

void ResultsLog::Setup() {
  absl::MutexLock lck(&mutex_);
  Load();
  try {
    util::File::MakeDirs(util::File::BaseDir(path_));
  } catch (const std::system_error& exc) {
    throw util::FatalError(exc.what());
  }
  fd_ = open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) throw OsError("open", path_);
  if (!records_.empty()) {
    LOG(INFO) << "Results log " << path_ << " has " << records_.size()
              << " records";
  }
}

void ResultsLog::Append(const proto::ResultRecord& record) {
  std::string line = Serialize(record) + "\n";
  absl::MutexLock lck(&mutex_);
  if (fd_ == -1) throw util::FatalError("results log " + path_ + " is closed");
  size_t written = 0;
  while (written < line.size()) {
    ssize_t n = write(fd_, line.data() + written, line.size() - written);
    if (n == -1) {
      if (errno == EINTR) continue;
      throw OsError("write", path_);
    }
    written += n;
  }
  if (fsync(fd_) == -1) throw OsError("fsync", path_);
  records_.push_back(record);
}

void ResultsLog::TearDown() {
  absl::MutexLock lck(&mutex_);
  if (fd_ == -1) return;
  int fd = fd_;
  fd_ = -1;
  if (close(fd) == -1) throw OsError("close", path_);
}

bool ResultsLog::IsDone(const std::string& instance_id,
                        const std::string& agent) const {
  absl::MutexLock lck(&mutex_);
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (it->instance_id() == instance_id && it->agent() == agent) {
      return it->state() == proto::SpecState::STATE_DONE;
    }
  }
  return false;
}

std::map<RecordKey, proto::ResultRecord> ResultsLog::Latest() const {
  absl::MutexLock lck(&mutex_);
  std::map<RecordKey, proto::ResultRecord> latest;
  for (const proto::ResultRecord& record : records_) {
    latest[RecordKey(record.instance_id(), record.agent())] = record;
  }
  return latest;
}

std::vector<proto::ResultRecord> ResultsLog::Records() const {
  absl::MutexLock lck(&mutex_);
  return records_;
}

}  // namespace manager
