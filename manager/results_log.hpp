#ifndef MANAGER_RESULTS_LOG_HPP
#define MANAGER_RESULTS_LOG_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/result.pb.h"

namespace manager {

// Instance id and agent name of a record.
using RecordKey = std::pair<std::string, std::string>;

// Append-only JSON-lines file with one ResultRecord per attempted spec. Every
// record is synced to disk before Append returns, so a crash loses at most
// the records that were still being written.
class ResultsLog {
 public:
  explicit ResultsLog(std::string path) : path_(std::move(path)) {}
  ~ResultsLog();

  // Reads the records already in the log and opens it for appending. A
  // truncated last line is dropped from the file. Throws util::FatalError.
  void Setup();

  // Writes record and syncs it. Throws util::FatalError.
  void Append(const proto::ResultRecord& record);

  // Closes the log. Throws util::FatalError.
  void TearDown();

  // Whether the last record of instance_id evaluated with agent is Done.
  bool IsDone(const std::string& instance_id, const std::string& agent) const;

  // The last record of every instance and agent.
  std::map<RecordKey, proto::ResultRecord> Latest() const;

  // Every record, in log order.
  std::vector<proto::ResultRecord> Records() const;

  static std::string Serialize(const proto::ResultRecord& record);

  ResultsLog(const ResultsLog&) = delete;
  ResultsLog& operator=(const ResultsLog&) = delete;
  ResultsLog(ResultsLog&&) = delete;
  ResultsLog& operator=(ResultsLog&&) = delete;

 private:
  void Load() EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  std::string path_;
  mutable absl::Mutex mutex_;
  int fd_ GUARDED_BY(mutex_) = -1;
  std::vector<proto::ResultRecord> records_ GUARDED_BY(mutex_);
};

}  // namespace manager

#endif
