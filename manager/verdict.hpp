#ifndef MANAGER_VERDICT_HPP
#define MANAGER_VERDICT_HPP

#include <map>
#include <string>
#include <vector>

#include "proto/result.pb.h"
#include "selector/test_selector.hpp"

namespace manager {

using Outcomes = std::map<std::string, proto::TestStatus>;

Outcomes ToOutcomes(const std::vector<proto::TestResult>& results);

struct Scoring {
  proto::Verdict verdict = proto::Verdict::VERDICT_UNKNOWN;
  proto::FailureReason failure_reason = proto::FailureReason::REASON_NONE;
  std::string message;
};

// Tests whose pre-patch status contradicts their set: FAIL_TO_PASS tests must
// fail and PASS_TO_PASS tests must pass before the candidate patch.
std::vector<std::string> PreconditionViolations(
    const selector::Selection& selection, const Outcomes& pre);

// Removes the tests violating the preconditions from a derived selection.
// Returns how many were removed.
size_t DropViolations(selector::Selection* selection, const Outcomes& pre);

// Removes the tests that do not pass with the gold patch applied from a
// derived selection. After DropViolations, FAIL_TO_PASS is left with the
// tests failing before and passing with the gold patch, PASS_TO_PASS with
// the tests passing in both. Returns how many were removed.
size_t DropUnconfirmed(selector::Selection* selection,
                       const Outcomes& reference);

// Resolved iff every FAIL_TO_PASS test goes from failed to passed and every
// PASS_TO_PASS test passes in both phases. Precondition violations make the
// verdict Error, as does an empty FAIL_TO_PASS set.
Scoring Score(const selector::Selection& selection, const Outcomes& pre,
              const Outcomes& post);

}  // namespace manager

#endif
