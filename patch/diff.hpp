#ifndef PATCH_DIFF_HPP
#define PATCH_DIFF_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace patch {

class MalformedDiff : public std::runtime_error {
 public:
  explicit MalformedDiff(const std::string& msg) : std::runtime_error(msg) {}
};

struct HunkLine {
  // ' ' for context, '-' for removed and '+' for added lines.
  char kind;
  std::string text;
};

struct Hunk {
  int old_start = 0;
  int old_count = 0;
  int new_start = 0;
  int new_count = 0;
  std::vector<HunkLine> lines;
  // Set by "\ No newline at end of file".
  bool old_missing_newline = false;
  bool new_missing_newline = false;

  std::vector<std::string> OldLines() const;
  std::vector<std::string> NewLines() const;
};

struct FileDiff {
  std::string old_path;
  std::string new_path;
  bool is_new = false;
  bool is_deleted = false;
  bool is_rename = false;
  bool is_binary = false;
  std::vector<Hunk> hunks;

  // The path of the file after the change, or before it for deletions.
  const std::string& Path() const { return is_deleted ? old_path : new_path; }

  // Lines whose content is touched, in post-image numbering (pre-image for
  // deletions). Context lines are not included.
  std::vector<std::pair<int, int>> ChangedRanges() const;

  // Same, in pre-image numbering: removed lines, and the position of
  // insertions.
  std::vector<std::pair<int, int>> ChangedOldRanges() const;
};

// Parses a unified or git diff. Throws MalformedDiff if the text is not a
// diff, is empty or has inconsistent hunks.
std::vector<FileDiff> ParseDiff(const std::string& text);

}  // namespace patch

#endif
