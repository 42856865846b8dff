#ifndef AGENT_TOKEN_USAGE_HPP
#define AGENT_TOKEN_USAGE_HPP

#include <string>

#include "proto/result.pb.h"

namespace agent {

// Extracts the token usage reported in an agent log, either as an
// "Execution Summary" table ("│ Input Tokens │ 123 │") or as a JSON line
// with a "usage" object ({"usage": {"input_tokens": 1, ...}}). The last
// report wins; missing counts are zero. A missing total is the sum of input
// and output.
proto::TokenUsage ParseTokenUsage(const std::string& log);

}  // namespace agent

#endif
