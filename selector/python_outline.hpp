#ifndef SELECTOR_PYTHON_OUTLINE_HPP
#define SELECTOR_PYTHON_OUTLINE_HPP

#include <string>
#include <vector>

namespace selector {

struct Region {
  enum Kind { FUNCTION, CLASS };
  Kind kind;
  std::string name;
  // Names of the enclosing regions and of this one, outermost first.
  std::vector<std::string> path;
  // Kinds of the enclosing regions, outermost first.
  std::vector<Kind> parent_kinds;
  int indent = 0;
  // 1-based and inclusive. first_line includes the decorators.
  int first_line = 0;
  int def_line = 0;
  int last_line = 0;

  bool Overlaps(int first, int last) const {
    return first <= last_line && last >= first_line;
  }
};

// The def and class blocks of a Python source file, found from indentation.
// Strings, comments, bracketed continuation lines and backslash
// continuations do not start or end blocks. Invalid code gives a best effort
// outline.
class PythonOutline {
 public:
  explicit PythonOutline(const std::string& source);

  // Sorted by first_line; nested regions come after their parent.
  const std::vector<Region>& Regions() const { return regions_; }

  // The innermost region containing line, or nullptr.
  const Region* Innermost(int line) const;

  const std::vector<std::string>& Lines() const { return lines_; }

  // Text of the lines of region.
  std::string Text(const Region& region) const;

 private:
  std::vector<std::string> lines_;
  std::vector<Region> regions_;
};

}  // namespace selector

#endif
