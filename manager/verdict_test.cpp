#include "manager/verdict.hpp"

#include "gtest/gtest.h"

namespace {

using proto::TestStatus;

const TestStatus P = TestStatus::TEST_PASSED;
const TestStatus F = TestStatus::TEST_FAILED;
const TestStatus E = TestStatus::TEST_ERRORED;
const TestStatus T = TestStatus::TEST_TIMED_OUT;
const TestStatus S = TestStatus::TEST_SKIPPED;

selector::Selection Tests() {
  selector::Selection selection;
  selection.fail_to_pass = {"t.py::test_fix"};
  selection.pass_to_pass = {"t.py::test_keep"};
  return selection;
}

manager::Outcomes Statuses(TestStatus fix, TestStatus keep) {
  return {{"t.py::test_fix", fix}, {"t.py::test_keep", keep}};
}

// NOLINTNEXTLINE
TEST(Verdict, TruthTable) {
  const TestStatus statuses[] = {P, F, E, T, S};
  for (TestStatus post_fix : statuses) {
    for (TestStatus post_keep : statuses) {
      manager::Scoring scoring = manager::Score(
          Tests(), Statuses(F, P), Statuses(post_fix, post_keep));
      bool resolved = post_fix == P && post_keep == P;
      EXPECT_EQ(scoring.verdict, resolved ? proto::Verdict::VERDICT_RESOLVED
                                          : proto::Verdict::VERDICT_UNRESOLVED)
          << TestStatus_Name(post_fix) << " " << TestStatus_Name(post_keep);
      EXPECT_EQ(scoring.failure_reason, proto::FailureReason::REASON_NONE);
    }
  }
}

// NOLINTNEXTLINE
TEST(Verdict, PreconditionViolation) {
  const TestStatus statuses[] = {P, F, E, T, S};
  for (TestStatus pre_fix : statuses) {
    for (TestStatus pre_keep : statuses) {
      if (pre_fix == F && pre_keep == P) continue;
      manager::Scoring scoring = manager::Score(
          Tests(), Statuses(pre_fix, pre_keep), Statuses(P, P));
      EXPECT_EQ(scoring.verdict, proto::Verdict::VERDICT_ERROR);
      EXPECT_EQ(scoring.failure_reason,
                proto::FailureReason::REASON_PRECONDITION_VIOLATION);
    }
  }
  manager::Scoring scoring =
      manager::Score(Tests(), Statuses(P, P), Statuses(P, P));
  EXPECT_NE(scoring.message.find("t.py::test_fix"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(Verdict, MissingOutcomes) {
  manager::Scoring scoring =
      manager::Score(Tests(), Statuses(F, P), {{"t.py::test_fix", P}});
  EXPECT_EQ(scoring.verdict, proto::Verdict::VERDICT_UNRESOLVED);
  EXPECT_NE(scoring.message.find("t.py::test_keep"), std::string::npos);

  scoring = manager::Score(Tests(), {{"t.py::test_fix", F}}, Statuses(P, P));
  EXPECT_EQ(scoring.verdict, proto::Verdict::VERDICT_ERROR);
}

// NOLINTNEXTLINE
TEST(Verdict, NoTests) {
  selector::Selection selection;
  selection.pass_to_pass = {"t.py::test_keep"};
  manager::Scoring scoring = manager::Score(selection, {}, {});
  EXPECT_EQ(scoring.verdict, proto::Verdict::VERDICT_ERROR);
  EXPECT_EQ(scoring.failure_reason,
            proto::FailureReason::REASON_NO_TESTS_SELECTED);
}

// NOLINTNEXTLINE
TEST(Verdict, DropViolations) {
  selector::Selection selection;
  selection.derived = true;
  selection.fail_to_pass = {"a", "b", "c"};
  selection.pass_to_pass = {"d", "e"};
  manager::Outcomes pre = {{"a", F}, {"b", P}, {"d", P}, {"e", F}};
  EXPECT_EQ(manager::DropViolations(&selection, pre), 3);
  EXPECT_EQ(selection.fail_to_pass, std::vector<std::string>({"a"}));
  EXPECT_EQ(selection.pass_to_pass, std::vector<std::string>({"d"}));
  EXPECT_TRUE(manager::PreconditionViolations(selection, pre).empty());
}

// NOLINTNEXTLINE
TEST(Verdict, DropUnconfirmed) {
  selector::Selection selection;
  selection.derived = true;
  selection.fail_to_pass = {"a", "b", "c"};
  selection.pass_to_pass = {"d", "e"};
  manager::Outcomes pre = {{"a", F}, {"b", F}, {"c", F}, {"d", P}, {"e", P}};
  manager::Outcomes gold = {{"a", P}, {"b", F}, {"d", P}, {"e", E}};
  EXPECT_EQ(manager::DropViolations(&selection, pre), 0);
  EXPECT_EQ(manager::DropUnconfirmed(&selection, gold), 3);
  EXPECT_EQ(selection.fail_to_pass, std::vector<std::string>({"a"}));
  EXPECT_EQ(selection.pass_to_pass, std::vector<std::string>({"d"}));
}

// NOLINTNEXTLINE
TEST(Verdict, ToOutcomes) {
  proto::TestResult result;
  result.set_test_id("a");
  result.set_status(T);
  manager::Outcomes outcomes = manager::ToOutcomes({result});
  ASSERT_EQ(outcomes.size(), 1);
  EXPECT_EQ(outcomes["a"], T);
}

}  // namespace
