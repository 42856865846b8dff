#include "manager/verdict.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace manager {

namespace {

proto::TestStatus StatusOf(const Outcomes& outcomes, const std::string& test) {
  auto it = outcomes.find(test);
  return it == outcomes.end() ? proto::TestStatus::TEST_UNKNOWN : it->second;
}

bool Is(const Outcomes& outcomes, const std::string& test,
        proto::TestStatus status) {
  return StatusOf(outcomes, test) == status;
}

// Removes from tests those without status in outcomes. Returns how many were
// removed.
size_t KeepWithStatus(std::vector<std::string>* tests, const Outcomes& outcomes,
                      proto::TestStatus status) {
  size_t before = tests->size();
  tests->erase(std::remove_if(tests->begin(), tests->end(),
                              [&outcomes, status](const std::string& test) {
                                return !Is(outcomes, test, status);
                              }),
               tests->end());
  return before - tests->size();
}

std::string Describe(const std::vector<std::string>& tests) {
  const size_t kShown = 5;
  std::vector<std::string> shown(
      tests.begin(), tests.begin() + std::min(tests.size(), kShown));
  std::string text = absl::StrJoin(shown, ", ");
  if (tests.size() > kShown) {
    absl::StrAppend(&text, " and ", tests.size() - kShown, " more");
  }
  return text;
}

}  // namespace

Outcomes ToOutcomes(const std::vector<proto::TestResult>& results) {
  Outcomes outcomes;
  for (const proto::TestResult& result : results) {
    outcomes[result.test_id()] = result.status();
  }
  return outcomes;
}

std::vector<std::string> PreconditionViolations(
    const selector::Selection& selection, const Outcomes& pre) {
  std::vector<std::string> violations;
  for (const std::string& test : selection.fail_to_pass) {
    if (!Is(pre, test, proto::TestStatus::TEST_FAILED)) {
      violations.push_back(test);
    }
  }
  for (const std::string& test : selection.pass_to_pass) {
    if (!Is(pre, test, proto::TestStatus::TEST_PASSED)) {
      violations.push_back(test);
    }
  }
  return violations;
}

size_t DropViolations(selector::Selection* selection, const Outcomes& pre) {
  return KeepWithStatus(&selection->fail_to_pass, pre,
                        proto::TestStatus::TEST_FAILED) +
         KeepWithStatus(&selection->pass_to_pass, pre,
                        proto::TestStatus::TEST_PASSED);
}

size_t DropUnconfirmed(selector::Selection* selection,
                       const Outcomes& reference) {
  return KeepWithStatus(&selection->fail_to_pass, reference,
                        proto::TestStatus::TEST_PASSED) +
         KeepWithStatus(&selection->pass_to_pass, reference,
                        proto::TestStatus::TEST_PASSED);
}

Scoring Score(const selector::Selection& selection, const Outcomes& pre,
              const Outcomes& post) {
  Scoring scoring;
  if (selection.fail_to_pass.empty()) {
    scoring.verdict = proto::Verdict::VERDICT_ERROR;
    scoring.failure_reason = proto::FailureReason::REASON_NO_TESTS_SELECTED;
    scoring.message = "no FAIL_TO_PASS tests";
    return scoring;
  }
  std::vector<std::string> violations = PreconditionViolations(selection, pre);
  if (!violations.empty()) {
    scoring.verdict = proto::Verdict::VERDICT_ERROR;
    scoring.failure_reason =
        proto::FailureReason::REASON_PRECONDITION_VIOLATION;
    scoring.message =
        absl::StrCat("unexpected pre-patch outcome of ", Describe(violations));
    return scoring;
  }
  std::vector<std::string> not_fixed;
  for (const std::string& test : selection.fail_to_pass) {
    if (!Is(post, test, proto::TestStatus::TEST_PASSED)) {
      not_fixed.push_back(test);
    }
  }
  std::vector<std::string> broken;
  for (const std::string& test : selection.pass_to_pass) {
    if (!Is(post, test, proto::TestStatus::TEST_PASSED)) {
      broken.push_back(test);
    }
  }
  if (not_fixed.empty() && broken.empty()) {
    scoring.verdict = proto::Verdict::VERDICT_RESOLVED;
    return scoring;
  }
  scoring.verdict = proto::Verdict::VERDICT_UNRESOLVED;
  std::vector<std::string> parts;
  if (!not_fixed.empty()) {
    parts.push_back("still failing: " + Describe(not_fixed));
  }
  if (!broken.empty()) parts.push_back("broken: " + Describe(broken));
  scoring.message = absl::StrJoin(parts, "; ");
  return scoring;
}

}  // namespace manager
