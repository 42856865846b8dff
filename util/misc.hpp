#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP

#include <string>
#include <vector>

namespace util {

// Quotes s so that a POSIX shell reads it as a single word.
std::string ShellQuote(const std::string& s);

// Splits text into lines, without the trailing newline characters. A final
// newline does not produce an empty line.
std::vector<std::string> SplitLines(const std::string& text);

// Removes ANSI escape sequences (colors, cursor movements).
std::string StripAnsi(const std::string& text);

}  // namespace util
#endif
