#include "agent/token_usage.hpp"

#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "util/misc.hpp"

namespace agent {

namespace {

const char kTableSeparator[] = "\xe2\x94\x82";  // U+2502

// "│ Input Tokens │ 1234 │" -> ("Input Tokens", 1234)
bool ParseTableRow(const std::string& line, std::string* key, int64_t* value) {
  std::vector<std::string> cells =
      absl::StrSplit(line, absl::ByString(kTableSeparator));
  std::vector<std::string> values;
  for (const std::string& cell : cells) {
    std::string stripped(absl::StripAsciiWhitespace(cell));
    if (!stripped.empty()) values.push_back(stripped);
  }
  if (values.size() < 2) return false;
  *key = values[0];
  return absl::SimpleAtoi(values[1], value);
}

bool ParseUsageJson(const std::string& line, proto::TokenUsage* usage) {
  google::protobuf::Struct event;
  if (!google::protobuf::util::JsonStringToMessage(line, &event).ok()) {
    return false;
  }
  auto it = event.fields().find("usage");
  if (it == event.fields().end() || !it->second.has_struct_value()) {
    return false;
  }
  const auto& fields = it->second.struct_value().fields();
  auto number = [&fields](const char* name) -> int64_t {
    auto field = fields.find(name);
    if (field == fields.end()) return 0;
    return static_cast<int64_t>(field->second.number_value());
  };
  usage->set_input_tokens(number("input_tokens"));
  usage->set_output_tokens(number("output_tokens"));
  usage->set_total_tokens(number("total_tokens"));
  return true;
}

}  // namespace

proto::TokenUsage ParseTokenUsage(const std::string& log) {
  proto::TokenUsage usage;
  for (const std::string& raw : util::SplitLines(util::StripAnsi(log))) {
    std::string line(absl::StripAsciiWhitespace(raw));
    if (absl::StartsWith(line, kTableSeparator)) {
      std::string key;
      int64_t value = 0;
      if (!ParseTableRow(line, &key, &value)) continue;
      if (key == "Input Tokens") {
        usage.set_input_tokens(value);
      } else if (key == "Output Tokens") {
        usage.set_output_tokens(value);
      } else if (key == "Total Tokens") {
        usage.set_total_tokens(value);
      }
    } else if (absl::StartsWith(line, "{")) {
      proto::TokenUsage reported;
      if (ParseUsageJson(line, &reported)) usage = reported;
    }
  }
  if (usage.total_tokens() == 0) {
    usage.set_total_tokens(usage.input_tokens() + usage.output_tokens());
  }
  return usage;
}

}  // namespace agent
