#ifndef PATCH_WORKING_TREE_HPP
#define PATCH_WORKING_TREE_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/types/optional.h"

namespace patch {

// A checked-out source tree. Paths are relative to the root of the tree.
class WorkingTree {
 public:
  // Returns absl::nullopt if the file does not exist.
  virtual absl::optional<std::string> ReadFile(const std::string& path) = 0;
  virtual void WriteFile(const std::string& path,
                         const std::string& content) = 0;
  virtual void RemoveFile(const std::string& path) = 0;
  // Every file of the tree, ignored files excluded.
  virtual std::vector<std::string> ListFiles() = 0;

  WorkingTree() = default;
  virtual ~WorkingTree() = default;
  WorkingTree(const WorkingTree&) = delete;
  WorkingTree& operator=(const WorkingTree&) = delete;
  WorkingTree(WorkingTree&&) = delete;
  WorkingTree& operator=(WorkingTree&&) = delete;
};

class MemoryTree : public WorkingTree {
 public:
  MemoryTree() = default;
  explicit MemoryTree(std::map<std::string, std::string> files)
      : files_(std::move(files)) {}

  absl::optional<std::string> ReadFile(const std::string& path) override {
    auto it = files_.find(path);
    if (it == files_.end()) return absl::nullopt;
    return it->second;
  }
  void WriteFile(const std::string& path, const std::string& content) override {
    files_[path] = content;
  }
  void RemoveFile(const std::string& path) override { files_.erase(path); }
  std::vector<std::string> ListFiles() override {
    std::vector<std::string> paths;
    for (const auto& file : files_) paths.push_back(file.first);
    return paths;
  }

  const std::map<std::string, std::string>& Files() const { return files_; }

 private:
  std::map<std::string, std::string> files_;
};

}  // namespace patch

#endif
