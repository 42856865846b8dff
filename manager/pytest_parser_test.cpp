#include "manager/pytest_parser.hpp"

#include "gtest/gtest.h"

namespace {

const char kOutput[] =
    "..F.s                                                   [100%]\n"
    "==================== short test summary info ====================\n"
    "PASSED tests/test_a.py::test_one\n"
    "\x1b[31mFAILED\x1b[0m tests/test_a.py::TestThing::test_two - "
    "AssertionError: 1 != 2\n"
    "SKIPPED [1] tests/test_a.py:40: needs network\n"
    "PASSED tests/test_b.py::test_param[1]\n"
    "SKIPPED tests/test_b.py::test_skipped[1]\n"
    "FAILED tests/test_b.py::test_mixed[1]\n"
    "PASSED tests/test_b.py::test_mixed[2]\n"
    "ERROR tests/test_c.py - ImportError: cannot import name 'x'\n"
    "============ 1 failed, 4 passed, 1 skipped in 0.12s ============\n";

// NOLINTNEXTLINE
TEST(PytestParser, SummarySection) {
  std::map<std::string, proto::TestStatus> results =
      manager::ParsePytestOutput(kOutput);
  EXPECT_EQ(results["tests/test_a.py::test_one"],
            proto::TestStatus::TEST_PASSED);
  EXPECT_EQ(results["tests/test_a.py::TestThing::test_two"],
            proto::TestStatus::TEST_FAILED);
  EXPECT_EQ(results["tests/test_b.py::test_param[1]"],
            proto::TestStatus::TEST_PASSED);
  EXPECT_EQ(results["tests/test_c.py"], proto::TestStatus::TEST_FAILED);
  EXPECT_EQ(results.count("tests/test_b.py::test_param"), 0);
}

// NOLINTNEXTLINE
TEST(PytestParser, WithoutSummary) {
  std::map<std::string, proto::TestStatus> results =
      manager::ParsePytestOutput(
          "collected 2 items\n"
          "PASSED t.py::test_x\n"
          "t.py::test_y FAILED\n");
  ASSERT_EQ(results.size(), 1);
  EXPECT_EQ(results["t.py::test_x"], proto::TestStatus::TEST_PASSED);
}

// NOLINTNEXTLINE
TEST(PytestParser, Status) {
  std::map<std::string, proto::TestStatus> results =
      manager::ParsePytestOutput(kOutput);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_a.py::test_one"),
            proto::TestStatus::TEST_PASSED);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_b.py::test_param"),
            proto::TestStatus::TEST_PASSED);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_b.py::test_mixed"),
            proto::TestStatus::TEST_FAILED);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_b.py::test_mixed[2]"),
            proto::TestStatus::TEST_PASSED);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_b.py::test_skipped"),
            proto::TestStatus::TEST_SKIPPED);
  EXPECT_EQ(manager::PytestStatus(results, "tests/test_c.py::test_new"),
            proto::TestStatus::TEST_FAILED);
  EXPECT_FALSE(
      manager::PytestStatus(results, "tests/test_d.py::test_none").has_value());
}

}  // namespace
