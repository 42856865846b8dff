#include "selector/python_outline.hpp"

#include <cctype>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/strip.h"
#include "util/misc.hpp"

namespace selector {

namespace {

// Lexical state carried from one physical line to the next.
struct ScanState {
  char quote = 0;
  bool triple = false;
  int depth = 0;
  bool continuation = false;

  bool AtStatementStart() const {
    return quote == 0 && depth == 0 && !continuation;
  }
};

void Scan(const std::string& line, ScanState* state) {
  state->continuation = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (state->quote != 0) {
      if (c == '\\') {
        i++;
      } else if (state->triple) {
        if (line.compare(i, 3, std::string(3, state->quote)) == 0) {
          state->quote = 0;
          i += 2;
        }
      } else if (c == state->quote) {
        state->quote = 0;
      }
      continue;
    }
    if (c == '#') break;
    if (c == '"' || c == '\'') {
      state->quote = c;
      state->triple = line.compare(i, 3, std::string(3, c)) == 0;
      if (state->triple) i += 2;
    } else if (c == '(' || c == '[' || c == '{') {
      state->depth++;
    } else if ((c == ')' || c == ']' || c == '}') && state->depth > 0) {
      state->depth--;
    }
  }
  // Unterminated single quoted strings end with the line.
  if (state->quote != 0 && !state->triple) {
    // A backslash at the end continues the string on the next line.
    if (line.empty() || line.back() != '\\') state->quote = 0;
    return;
  }
  if (state->quote == 0 && !line.empty() && line.back() == '\\') {
    state->continuation = true;
  }
}

int Indent(const std::string& line) {
  int indent = 0;
  for (char c : line) {
    if (c == ' ') {
      indent++;
    } else if (c == '\t') {
      indent = (indent / 8 + 1) * 8;
    } else {
      break;
    }
  }
  return indent;
}

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Recognizes "def name", "async def name" and "class name".
bool ParseHeader(absl::string_view statement, Region::Kind* kind,
                 std::string* name) {
  if (absl::ConsumePrefix(&statement, "async ")) {
    statement = absl::StripLeadingAsciiWhitespace(statement);
    if (!absl::StartsWith(statement, "def ")) return false;
  }
  if (absl::ConsumePrefix(&statement, "def ")) {
    *kind = Region::FUNCTION;
  } else if (absl::ConsumePrefix(&statement, "class ")) {
    *kind = Region::CLASS;
  } else {
    return false;
  }
  statement = absl::StripLeadingAsciiWhitespace(statement);
  size_t len = 0;
  while (len < statement.size() && IsIdentifierChar(statement[len])) len++;
  if (len == 0) return false;
  *name = std::string(statement.substr(0, len));
  return true;
}

}  // namespace

PythonOutline::PythonOutline(const std::string& source)
    : lines_(util::SplitLines(source)) {
  // Indexes in regions_ of the blocks still open.
  std::vector<size_t> open;
  ScanState state;
  int last_code_line = 0;
  int decorators_start = 0;

  auto close_until = [this, &open, &last_code_line](int indent) {
    while (!open.empty() && regions_[open.back()].indent >= indent) {
      regions_[open.back()].last_line = last_code_line;
      open.pop_back();
    }
  };

  for (size_t i = 0; i < lines_.size(); i++) {
    const std::string& line = lines_[i];
    int number = i + 1;
    bool statement_start = state.AtStatementStart();
    Scan(line, &state);
    absl::string_view stripped = absl::StripAsciiWhitespace(line);
    if (stripped.empty()) continue;
    if (!statement_start || stripped[0] == '#') {
      if (stripped[0] != '#') last_code_line = number;
      continue;
    }
    int indent = Indent(line);
    close_until(indent);
    last_code_line = number;
    if (stripped[0] == '@') {
      if (decorators_start == 0) decorators_start = number;
      continue;
    }
    Region region;
    if (ParseHeader(stripped, &region.kind, &region.name)) {
      region.indent = indent;
      region.def_line = number;
      region.first_line = decorators_start != 0 ? decorators_start : number;
      for (size_t parent : open) {
        region.path.push_back(regions_[parent].name);
        region.parent_kinds.push_back(regions_[parent].kind);
      }
      region.path.push_back(region.name);
      regions_.push_back(std::move(region));
      open.push_back(regions_.size() - 1);
    }
    decorators_start = 0;
  }
  close_until(0);
}

const Region* PythonOutline::Innermost(int line) const {
  const Region* innermost = nullptr;
  for (const Region& region : regions_) {
    if (region.first_line > line) break;
    if (region.last_line >= line) innermost = &region;
  }
  return innermost;
}

std::string PythonOutline::Text(const Region& region) const {
  std::string text;
  for (int line = region.first_line; line <= region.last_line; line++) {
    text += lines_[line - 1];
    text += '\n';
  }
  return text;
}

}  // namespace selector
