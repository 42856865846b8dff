#include "manager/pytest_parser.hpp"

#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/strip.h"
#include "util/misc.hpp"

namespace manager {

namespace {

const char kSummaryHeader[] = "short test summary info";

// "FAILED tests/test_a.py::test_x - AssertionError" -> test_a.py::test_x
bool ParseLine(absl::string_view line, std::string* test_id,
               proto::TestStatus* status) {
  struct Prefix {
    const char* word;
    proto::TestStatus status;
  };
  static const Prefix kPrefixes[] = {
      {"PASSED", proto::TestStatus::TEST_PASSED},
      {"FAILED", proto::TestStatus::TEST_FAILED},
      {"SKIPPED", proto::TestStatus::TEST_SKIPPED},
      {"ERROR", proto::TestStatus::TEST_FAILED},
  };
  for (const Prefix& prefix : kPrefixes) {
    absl::string_view rest = line;
    if (!absl::ConsumePrefix(&rest, prefix.word)) continue;
    if (rest.empty() || !absl::ascii_isspace(rest.front())) return false;
    rest = absl::StripAsciiWhitespace(rest);
    size_t message = rest.find(" - ");
    if (message != absl::string_view::npos) rest = rest.substr(0, message);
    rest = absl::StripTrailingAsciiWhitespace(rest);
    if (rest.empty()) return false;
    *test_id = std::string(rest);
    *status = prefix.status;
    return true;
  }
  return false;
}

}  // namespace

std::map<std::string, proto::TestStatus> ParsePytestOutput(
    const std::string& output) {
  std::string clean = util::StripAnsi(output);
  size_t summary = clean.find(kSummaryHeader);
  if (summary != std::string::npos) clean = clean.substr(summary);
  std::map<std::string, proto::TestStatus> results;
  for (const std::string& raw : util::SplitLines(clean)) {
    std::string test_id;
    proto::TestStatus status;
    if (ParseLine(absl::StripAsciiWhitespace(raw), &test_id, &status)) {
      results[test_id] = status;
    }
  }
  return results;
}

absl::optional<proto::TestStatus> PytestStatus(
    const std::map<std::string, proto::TestStatus>& results,
    const std::string& test_id) {
  auto exact = results.find(test_id);
  if (exact != results.end()) return exact->second;

  bool found = false;
  bool failed = false;
  bool passed = false;
  if (test_id.find('[') == std::string::npos) {
    const std::string prefix = test_id + "[";
    for (auto it = results.lower_bound(prefix);
         it != results.end() && absl::StartsWith(it->first, prefix); ++it) {
      found = true;
      if (it->second == proto::TestStatus::TEST_PASSED) {
        passed = true;
      } else if (it->second != proto::TestStatus::TEST_SKIPPED) {
        failed = true;
      }
    }
  }
  if (found) {
    if (failed) return proto::TestStatus::TEST_FAILED;
    return passed ? proto::TestStatus::TEST_PASSED
                  : proto::TestStatus::TEST_SKIPPED;
  }

  size_t separator = test_id.find("::");
  if (separator != std::string::npos) {
    auto file = results.find(test_id.substr(0, separator));
    if (file != results.end() &&
        file->second == proto::TestStatus::TEST_FAILED) {
      return proto::TestStatus::TEST_FAILED;
    }
  }
  return absl::nullopt;
}

}  // namespace manager
