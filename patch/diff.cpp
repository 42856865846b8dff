#include "patch/diff.hpp"

#include <algorithm>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/misc.hpp"

namespace patch {

namespace {

std::string StripPrefix(const std::string& path) {
  if (absl::StartsWith(path, "a/") || absl::StartsWith(path, "b/")) {
    return path.substr(2);
  }
  return path;
}

// "--- a/foo.py\t2020-01-01 ..." -> "foo.py"
std::string HeaderPath(const std::string& line) {
  std::string path = line.substr(4);
  size_t tab = path.find('\t');
  if (tab != std::string::npos) path = path.substr(0, tab);
  if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
    path = path.substr(1, path.size() - 2);
  }
  if (path == "/dev/null") return path;
  return StripPrefix(path);
}

void CheckPath(const std::string& path) {
  if (path.empty() || path[0] == '/' || path == ".." ||
      absl::StartsWith(path, "../") || absl::StrContains(path, "/../")) {
    throw MalformedDiff("invalid path in diff: " + path);
  }
}

// Parses "12,3" or "12" into start and count.
void ParseRange(const std::string& range, int* start, int* count) {
  std::vector<std::string> parts = absl::StrSplit(range, ',');
  if (parts.empty() || parts.size() > 2 || !absl::SimpleAtoi(parts[0], start)) {
    throw MalformedDiff("bad hunk range: " + range);
  }
  *count = 1;
  if (parts.size() == 2 && !absl::SimpleAtoi(parts[1], count)) {
    throw MalformedDiff("bad hunk range: " + range);
  }
  if (*start < 0 || *count < 0) throw MalformedDiff("bad hunk range: " + range);
}

Hunk ParseHunkHeader(const std::string& line) {
  // @@ -old_start,old_count +new_start,new_count @@ optional section
  size_t end = line.find(" @@", 2);
  if (end == std::string::npos) throw MalformedDiff("bad hunk header: " + line);
  std::vector<std::string> parts =
      absl::StrSplit(line.substr(3, end - 3), ' ', absl::SkipEmpty());
  if (parts.size() != 2 || parts[0][0] != '-' || parts[1][0] != '+') {
    throw MalformedDiff("bad hunk header: " + line);
  }
  Hunk hunk;
  ParseRange(parts[0].substr(1), &hunk.old_start, &hunk.old_count);
  ParseRange(parts[1].substr(1), &hunk.new_start, &hunk.new_count);
  return hunk;
}

// "\ No newline at end of file" refers to the line before it.
void MarkMissingNewline(Hunk* hunk) {
  char kind = hunk->lines.empty() ? ' ' : hunk->lines.back().kind;
  if (kind != '+') hunk->old_missing_newline = true;
  if (kind != '-') hunk->new_missing_newline = true;
}

void AddRange(std::vector<std::pair<int, int>>* ranges, int first, int last) {
  if (first < 1) first = 1;
  if (last < first) last = first;
  if (!ranges->empty() && ranges->back().second + 1 >= first) {
    ranges->back().second = std::max(ranges->back().second, last);
    return;
  }
  ranges->emplace_back(first, last);
}

}  // namespace

std::vector<std::string> Hunk::OldLines() const {
  std::vector<std::string> out;
  for (const HunkLine& line : lines) {
    if (line.kind != '+') out.push_back(line.text);
  }
  return out;
}

std::vector<std::string> Hunk::NewLines() const {
  std::vector<std::string> out;
  for (const HunkLine& line : lines) {
    if (line.kind != '-') out.push_back(line.text);
  }
  return out;
}

std::vector<std::pair<int, int>> FileDiff::ChangedRanges() const {
  if (is_deleted) return ChangedOldRanges();
  std::vector<std::pair<int, int>> ranges;
  for (const Hunk& hunk : hunks) {
    int new_line = hunk.new_start;
    for (const HunkLine& line : hunk.lines) {
      if (line.kind == '+') {
        AddRange(&ranges, new_line, new_line);
        new_line++;
      } else if (line.kind == '-') {
        AddRange(&ranges, new_line - 1, new_line);
      } else {
        new_line++;
      }
    }
  }
  return ranges;
}

std::vector<std::pair<int, int>> FileDiff::ChangedOldRanges() const {
  std::vector<std::pair<int, int>> ranges;
  for (const Hunk& hunk : hunks) {
    int old_line = hunk.old_start;
    for (const HunkLine& line : hunk.lines) {
      if (line.kind == '-') {
        AddRange(&ranges, old_line, old_line);
        old_line++;
      } else if (line.kind == '+') {
        AddRange(&ranges, old_line - 1, old_line);
      } else {
        old_line++;
      }
    }
  }
  return ranges;
}

std::vector<FileDiff> ParseDiff(const std::string& text) {
  std::vector<std::string> lines = util::SplitLines(text);
  std::vector<FileDiff> files;
  FileDiff* current = nullptr;
  // Set after a "diff --git" header, until the first hunk of that file.
  bool in_git_header = false;

  for (size_t i = 0; i < lines.size(); i++) {
    const std::string& line = lines[i];
    if (absl::StartsWith(line, "diff --git ")) {
      files.emplace_back();
      current = &files.back();
      in_git_header = true;
      std::string paths = line.substr(11);
      size_t split = paths.rfind(" b/");
      if (split == std::string::npos) {
        throw MalformedDiff("bad diff header: " + line);
      }
      current->old_path = StripPrefix(paths.substr(0, split));
      current->new_path = paths.substr(split + 3);
      continue;
    }
    if (in_git_header) {
      if (absl::StartsWith(line, "new file mode")) {
        current->is_new = true;
        continue;
      }
      if (absl::StartsWith(line, "deleted file mode")) {
        current->is_deleted = true;
        continue;
      }
      if (absl::StartsWith(line, "rename from ")) {
        current->is_rename = true;
        current->old_path = line.substr(12);
        continue;
      }
      if (absl::StartsWith(line, "rename to ")) {
        current->is_rename = true;
        current->new_path = line.substr(10);
        continue;
      }
      if (absl::StartsWith(line, "Binary files ") ||
          absl::StartsWith(line, "GIT binary patch")) {
        current->is_binary = true;
        continue;
      }
    }
    if (absl::StartsWith(line, "--- ") && i + 1 < lines.size() &&
        absl::StartsWith(lines[i + 1], "+++ ")) {
      std::string old_path = HeaderPath(line);
      std::string new_path = HeaderPath(lines[i + 1]);
      if (!in_git_header) {
        files.emplace_back();
        current = &files.back();
      }
      in_git_header = false;
      if (old_path == "/dev/null") {
        current->is_new = true;
      } else {
        current->old_path = old_path;
      }
      if (new_path == "/dev/null") {
        current->is_deleted = true;
      } else {
        current->new_path = new_path;
      }
      if (current->is_new) current->old_path = current->new_path;
      if (current->is_deleted) current->new_path = current->old_path;
      i++;
      continue;
    }
    if (absl::StartsWith(line, "@@ ")) {
      if (current == nullptr) throw MalformedDiff("hunk outside of a file");
      in_git_header = false;
      Hunk hunk = ParseHunkHeader(line);
      int old_left = hunk.old_count;
      int new_left = hunk.new_count;
      while ((old_left > 0 || new_left > 0) && i + 1 < lines.size()) {
        const std::string& body = lines[++i];
        char kind = body.empty() ? ' ' : body[0];
        if (kind == '\\') {
          MarkMissingNewline(&hunk);
          continue;
        }
        if (kind != ' ' && kind != '-' && kind != '+') {
          throw MalformedDiff(absl::StrCat("unexpected line in hunk of ",
                                           current->Path(), ": ", body));
        }
        if (kind != '+') old_left--;
        if (kind != '-') new_left--;
        if (old_left < 0 || new_left < 0) {
          throw MalformedDiff("hunk longer than its header in " +
                              current->Path());
        }
        hunk.lines.push_back(
            HunkLine{kind, body.empty() ? "" : body.substr(1)});
      }
      if (old_left > 0 || new_left > 0) {
        throw MalformedDiff("truncated hunk in " + current->Path());
      }
      // A trailing "\ No newline at end of file" refers to the last line.
      while (i + 1 < lines.size() && absl::StartsWith(lines[i + 1], "\\")) {
        i++;
        MarkMissingNewline(&hunk);
      }
      current->hunks.push_back(std::move(hunk));
      continue;
    }
    // Anything else (commit messages, index lines, mode changes) is ignored.
  }

  if (files.empty()) throw MalformedDiff("no file changes found");
  for (const FileDiff& file : files) {
    CheckPath(file.old_path);
    CheckPath(file.new_path);
  }
  return files;
}

}  // namespace patch
