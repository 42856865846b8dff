#include "manager/spec_source.hpp"

#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace manager {

namespace {

proto::EvaluationSpec ParseSpec(const std::string& json,
                                const std::string& where) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  proto::EvaluationSpec spec;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, &spec, options);
  if (!status.ok()) {
    throw SpecError(absl::StrCat(where, ": ", status.ToString()));
  }
  std::vector<std::string> missing;
  if (spec.instance_id().empty()) missing.push_back("instance_id");
  if (spec.repo().empty()) missing.push_back("repo");
  if (spec.base_commit().empty()) missing.push_back("base_commit");
  if (!spec.has_environment()) missing.push_back("environment");
  if (spec.problem_statement().empty()) missing.push_back("problem_statement");
  if (spec.test_patch().empty()) missing.push_back("test_patch");
  if (!missing.empty()) {
    throw SpecError(absl::StrCat(where, " (", spec.instance_id(),
                                 "): missing ", absl::StrJoin(missing, ", ")));
  }
  return spec;
}

}  // namespace

std::vector<proto::EvaluationSpec> ParseSpecs(const std::string& text) {
  std::vector<proto::EvaluationSpec> specs;
  absl::string_view content = absl::StripLeadingAsciiWhitespace(text);
  if (!content.empty() && content.front() == '[') {
    google::protobuf::ListValue list;
    auto status = google::protobuf::util::JsonStringToMessage(
        std::string(content), &list);
    if (!status.ok()) throw SpecError("spec array: " + status.ToString());
    for (int i = 0; i < list.values_size(); i++) {
      std::string json;
      status =
          google::protobuf::util::MessageToJsonString(list.values(i), &json);
      if (!status.ok()) throw SpecError("spec array: " + status.ToString());
      specs.push_back(ParseSpec(json, absl::StrCat("element ", i)));
    }
  } else {
    std::vector<std::string> lines = util::SplitLines(text);
    for (size_t i = 0; i < lines.size(); i++) {
      if (absl::StripAsciiWhitespace(lines[i]).empty()) continue;
      specs.push_back(ParseSpec(lines[i], absl::StrCat("line ", i + 1)));
    }
  }
  std::set<std::string> seen;
  for (const proto::EvaluationSpec& spec : specs) {
    if (!seen.insert(spec.instance_id()).second) {
      throw SpecError("duplicate instance id " + spec.instance_id());
    }
  }
  return specs;
}

std::vector<proto::EvaluationSpec> LoadSpecs(const std::string& path) {
  std::string text;
  try {
    text = util::File::ReadAll(path);
  } catch (const std::system_error& exc) {
    throw SpecError(path + ": " + exc.what());
  }
  std::vector<proto::EvaluationSpec> specs = ParseSpecs(text);
  LOG(INFO) << "Loaded " << specs.size() << " specs from " << path;
  return specs;
}

}  // namespace manager
