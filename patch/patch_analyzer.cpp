#include "patch/patch_analyzer.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <vector>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "patch/diff.hpp"

namespace patch {

namespace {

struct Content {
  std::vector<std::string> lines;
  bool trailing_newline = true;
};

Content Split(const std::string& text) {
  Content content;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      content.lines.push_back(text.substr(start));
      content.trailing_newline = false;
      break;
    }
    content.lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return content;
}

std::string Join(const Content& content) {
  std::string text;
  for (size_t i = 0; i < content.lines.size(); i++) {
    text += content.lines[i];
    if (i + 1 < content.lines.size() || content.trailing_newline) {
      text += '\n';
    }
  }
  return text;
}

// Diff lines never carry the carriage return of CRLF files.
bool SameLine(const std::string& file_line, const std::string& diff_line) {
  if (file_line.size() == diff_line.size() + 1 && file_line.back() == '\r') {
    return file_line.compare(0, diff_line.size(), diff_line) == 0;
  }
  return file_line == diff_line;
}

bool MatchesAt(const std::vector<std::string>& buffer,
               const std::vector<std::string>& pattern, int pos) {
  if (pos < 0 || pos + pattern.size() > buffer.size()) return false;
  for (size_t i = 0; i < pattern.size(); i++) {
    if (!SameLine(buffer[pos + i], pattern[i])) return false;
  }
  return true;
}

// Finds the position of pattern closest to expected, not before min_pos.
// Returns -1 if there is none within max_offset lines.
int Locate(const std::vector<std::string>& buffer,
           const std::vector<std::string>& pattern, int expected, int min_pos,
           int max_offset) {
  if (pattern.empty()) {
    int pos = std::max(min_pos, std::min<int>(expected, buffer.size()));
    return std::abs(pos - expected) <= max_offset ? pos : -1;
  }
  for (int distance = 0; distance <= max_offset; distance++) {
    int before = expected - distance;
    if (before >= min_pos && MatchesAt(buffer, pattern, before)) return before;
    int after = expected + distance;
    if (distance > 0 && after >= min_pos && MatchesAt(buffer, pattern, after)) {
      return after;
    }
    if (before < min_pos && after + pattern.size() > buffer.size()) break;
  }
  return -1;
}

// The lines of a hunk with up to fuzz context lines dropped from each end.
struct FuzzedHunk {
  std::vector<HunkLine> lines;
  int leading_dropped = 0;
  int trailing_dropped = 0;

  std::vector<std::string> OldLines() const {
    std::vector<std::string> out;
    for (const HunkLine& line : lines) {
      if (line.kind != '+') out.push_back(line.text);
    }
    return out;
  }
  std::vector<std::string> NewLines() const {
    std::vector<std::string> out;
    for (const HunkLine& line : lines) {
      if (line.kind != '-') out.push_back(line.text);
    }
    return out;
  }
};

FuzzedHunk Fuzz(const Hunk& hunk, int fuzz) {
  FuzzedHunk fuzzed;
  size_t begin = 0;
  size_t end = hunk.lines.size();
  while (fuzzed.leading_dropped < fuzz && begin < end &&
         hunk.lines[begin].kind == ' ') {
    begin++;
    fuzzed.leading_dropped++;
  }
  while (fuzzed.trailing_dropped < fuzz && end > begin &&
         hunk.lines[end - 1].kind == ' ') {
    end--;
    fuzzed.trailing_dropped++;
  }
  fuzzed.lines.assign(hunk.lines.begin() + begin, hunk.lines.begin() + end);
  return fuzzed;
}

enum class HunksResult { kChanged, kAlreadyApplied, kConflict };

// Applies the hunks of file to content. On conflict content is left in an
// unspecified state and error describes the failing hunk.
HunksResult ApplyHunks(const FileDiff& file, const PatchOptions& options,
                       Content* content, std::string* error) {
  std::vector<std::string>& buffer = content->lines;
  // Difference between where hunks are found and where they are declared.
  int shift = 0;
  int min_pos = 0;
  bool changed = false;
  for (size_t h = 0; h < file.hunks.size(); h++) {
    const Hunk& hunk = file.hunks[h];
    int declared = hunk.old_count == 0 ? hunk.old_start : hunk.old_start - 1;
    int expected = declared + shift;
    bool old_empty = hunk.OldLines().empty();
    bool placed = false;
    for (int fuzz = 0; fuzz <= options.fuzz && !placed; fuzz++) {
      FuzzedHunk fuzzed = Fuzz(hunk, fuzz);
      if (fuzz > 0 && fuzzed.leading_dropped + fuzzed.trailing_dropped == 0) {
        break;
      }
      std::vector<std::string> old_lines = fuzzed.OldLines();
      std::vector<std::string> new_lines = fuzzed.NewLines();
      // Dropping every context line would let the hunk match anywhere.
      if (old_lines.empty() && !old_empty) continue;
      int target = expected + fuzzed.leading_dropped;

      // A pure insertion is already applied if its lines are in place.
      int pos = -1;
      bool already = false;
      if (old_empty && !new_lines.empty() &&
          MatchesAt(buffer, new_lines, std::max(target, min_pos))) {
        pos = std::max(target, min_pos);
        already = true;
      }
      if (pos < 0) {
        pos = Locate(buffer, old_lines, target, min_pos, options.max_offset);
      }
      if (pos < 0 && !new_lines.empty() && new_lines != old_lines) {
        pos = Locate(buffer, new_lines, target, min_pos, options.max_offset);
        already = pos >= 0;
      }
      if (pos < 0) continue;

      if (pos != target || fuzz > 0) {
        VLOG(1) << "Hunk #" << h + 1 << " of " << file.Path() << " placed at "
                << pos + 1 << " (offset " << pos - target << ", fuzz " << fuzz
                << ")";
      }
      int old_size = old_lines.size();
      int new_size = new_lines.size();
      if (!already) {
        bool at_end = pos + old_size == static_cast<int>(buffer.size());
        std::vector<std::string> replacement;
        int cursor = pos;
        for (const HunkLine& line : fuzzed.lines) {
          if (line.kind == ' ') {
            replacement.push_back(buffer[cursor++]);
          } else if (line.kind == '-') {
            cursor++;
          } else {
            replacement.push_back(line.text);
          }
        }
        buffer.erase(buffer.begin() + pos, buffer.begin() + pos + old_size);
        buffer.insert(buffer.begin() + pos, replacement.begin(),
                      replacement.end());
        if (at_end && fuzzed.trailing_dropped == 0) {
          content->trailing_newline = !hunk.new_missing_newline;
        }
        changed |= old_lines != new_lines;
      }
      shift += pos - target + new_size - old_size;
      min_pos = pos + new_size;
      placed = true;
    }
    if (!placed) {
      *error = absl::StrCat("hunk #", h + 1, " of ", file.Path(),
                            " does not apply at line ", hunk.old_start);
      return HunksResult::kConflict;
    }
  }
  return changed ? HunksResult::kChanged : HunksResult::kAlreadyApplied;
}

std::string NewFileContent(const FileDiff& file) {
  Content content;
  for (const Hunk& hunk : file.hunks) {
    for (std::string& line : hunk.NewLines()) {
      content.lines.push_back(std::move(line));
    }
    content.trailing_newline = !hunk.new_missing_newline;
  }
  return Join(content);
}

// Changes to the tree, kept in memory until every file diff is placed.
class Staging {
 public:
  explicit Staging(WorkingTree* tree) : tree_(tree) {}

  absl::optional<std::string> Read(const std::string& path) {
    auto it = staged_.find(path);
    if (it != staged_.end()) return it->second;
    return tree_->ReadFile(path);
  }

  void Write(const std::string& path, std::string content) {
    Stage(path, std::move(content));
  }
  void Remove(const std::string& path) { Stage(path, absl::nullopt); }

  const std::vector<std::string>& Paths() const { return order_; }

  // Writes the staged changes. If a write fails the files already written,
  // and the one that failed, are restored and the error is rethrown.
  void Commit() {
    size_t done = 0;
    try {
      for (; done < order_.size(); done++) {
        Store(order_[done], staged_[order_[done]]);
      }
    } catch (const std::exception& e) {
      LOG(ERROR) << "Failed to write " << order_[done] << ": " << e.what()
                 << ", rolling back";
      // The failed write may have left the file half written.
      for (size_t restored = done + 1; restored-- > 0;) {
        try {
          Store(order_[restored], original_[order_[restored]]);
        } catch (const std::exception& restore_error) {
          LOG(ERROR) << "Failed to restore " << order_[restored] << ": "
                     << restore_error.what();
        }
      }
      throw;
    }
  }

 private:
  void Stage(const std::string& path, absl::optional<std::string> content) {
    if (!staged_.count(path)) {
      original_[path] = tree_->ReadFile(path);
      order_.push_back(path);
    }
    staged_[path] = std::move(content);
  }

  void Store(const std::string& path,
             const absl::optional<std::string>& content) {
    if (content) {
      tree_->WriteFile(path, *content);
    } else if (tree_->ReadFile(path)) {
      tree_->RemoveFile(path);
    }
  }

  WorkingTree* tree_;
  std::map<std::string, absl::optional<std::string>> staged_;
  std::map<std::string, absl::optional<std::string>> original_;
  std::vector<std::string> order_;
};

// Returns false and sets error on conflict, sets *changed when the file diff
// is not already applied.
bool StageFile(const FileDiff& file, const PatchOptions& options,
               Staging* staging, bool* changed, std::string* error) {
  *changed = false;
  if (file.is_new) {
    std::string expected = NewFileContent(file);
    absl::optional<std::string> existing = staging->Read(file.new_path);
    if (existing) {
      if (*existing == expected) return true;
      *error = file.new_path + " already exists";
      return false;
    }
    staging->Write(file.new_path, expected);
    *changed = true;
    return true;
  }

  if (file.is_deleted) {
    absl::optional<std::string> existing = staging->Read(file.old_path);
    if (!existing) return true;
    Content content = Split(*existing);
    if (ApplyHunks(file, options, &content, error) == HunksResult::kConflict) {
      return false;
    }
    if (!content.lines.empty()) {
      *error = file.old_path + " does not match the deleted content";
      return false;
    }
    staging->Remove(file.old_path);
    *changed = true;
    return true;
  }

  absl::optional<std::string> source = staging->Read(file.old_path);
  if (file.is_rename && !source) {
    // Renamed already: the hunks must be in place at the new path.
    absl::optional<std::string> target = staging->Read(file.new_path);
    if (!target) {
      *error = file.old_path + " does not exist";
      return false;
    }
    Content content = Split(*target);
    HunksResult result = ApplyHunks(file, options, &content, error);
    if (result == HunksResult::kAlreadyApplied) return true;
    if (result == HunksResult::kChanged) {
      *error = file.old_path + " does not exist";
    }
    return false;
  }
  if (!source) {
    *error = file.old_path + " does not exist";
    return false;
  }
  if (file.is_rename && staging->Read(file.new_path)) {
    *error = file.new_path + " already exists";
    return false;
  }
  Content content = Split(*source);
  HunksResult result = ApplyHunks(file, options, &content, error);
  if (result == HunksResult::kConflict) return false;
  if (file.is_rename) {
    staging->Remove(file.old_path);
    staging->Write(file.new_path, Join(content));
    *changed = true;
  } else if (result == HunksResult::kChanged) {
    staging->Write(file.new_path, Join(content));
    *changed = true;
  }
  return true;
}

}  // namespace

proto::PatchApplication Apply(WorkingTree* tree, const std::string& diff,
                              proto::PatchTarget target,
                              const PatchOptions& options) {
  proto::PatchApplication application;
  application.set_target(target);

  std::vector<FileDiff> files;
  try {
    files = ParseDiff(diff);
  } catch (const MalformedDiff& e) {
    application.set_outcome(proto::PatchOutcome::PATCH_MALFORMED);
    application.set_message(e.what());
    return application;
  }

  Staging staging(tree);
  bool any_change = false;
  for (const FileDiff& file : files) {
    if (options.exclude.count(file.old_path) ||
        options.exclude.count(file.new_path)) {
      VLOG(1) << "Ignoring changes to " << file.Path();
      continue;
    }
    if (file.is_binary) {
      application.set_outcome(proto::PatchOutcome::PATCH_MALFORMED);
      application.set_message("binary patch for " + file.Path());
      return application;
    }
    bool changed = false;
    std::string error;
    if (!StageFile(file, options, &staging, &changed, &error)) {
      application.set_outcome(proto::PatchOutcome::PATCH_CONFLICT);
      application.set_message(error);
      return application;
    }
    any_change |= changed;
  }

  if (!any_change) {
    application.set_outcome(proto::PatchOutcome::PATCH_NO_OP);
    application.set_message("the changes are already present");
    return application;
  }
  if (!options.dry_run) staging.Commit();
  for (const std::string& path : staging.Paths()) {
    application.add_changed_files(path);
  }
  application.set_outcome(proto::PatchOutcome::PATCH_APPLIED);
  return application;
}

std::set<std::string> TouchedFiles(const std::string& diff) {
  std::set<std::string> paths;
  try {
    for (const FileDiff& file : ParseDiff(diff)) {
      paths.insert(file.old_path);
      paths.insert(file.new_path);
    }
  } catch (const MalformedDiff& e) {
    VLOG(1) << "Cannot list the files of a malformed diff: " << e.what();
  }
  return paths;
}

}  // namespace patch
