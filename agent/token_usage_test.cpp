#include "agent/token_usage.hpp"

#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(TokenUsage, ExecutionSummaryTable) {
  proto::TokenUsage usage = agent::ParseTokenUsage(
      "Execution Summary\n"
      "\xe2\x94\x82 Input Tokens  \xe2\x94\x82 1200 \xe2\x94\x82\n"
      "\x1b[1m\xe2\x94\x82 Output Tokens \xe2\x94\x82 300  "
      "\xe2\x94\x82\x1b[0m\n"
      "\xe2\x94\x82 Total Tokens  \xe2\x94\x82 1600 \xe2\x94\x82\n"
      "\xe2\x94\x82 Steps         \xe2\x94\x82 12   \xe2\x94\x82\n");
  EXPECT_EQ(usage.input_tokens(), 1200);
  EXPECT_EQ(usage.output_tokens(), 300);
  EXPECT_EQ(usage.total_tokens(), 1600);
}

// NOLINTNEXTLINE
TEST(TokenUsage, JsonResultLine) {
  proto::TokenUsage usage = agent::ParseTokenUsage(
      "{\"type\":\"assistant\"}\n"
      "{\"type\":\"result\",\"usage\":{\"input_tokens\":10,"
      "\"output_tokens\":5}}\n");
  EXPECT_EQ(usage.input_tokens(), 10);
  EXPECT_EQ(usage.output_tokens(), 5);
  EXPECT_EQ(usage.total_tokens(), 15);
}

// NOLINTNEXTLINE
TEST(TokenUsage, NothingReported) {
  proto::TokenUsage usage = agent::ParseTokenUsage("done\n{not json\n");
  EXPECT_EQ(usage.input_tokens(), 0);
  EXPECT_EQ(usage.total_tokens(), 0);
}

}  // namespace
