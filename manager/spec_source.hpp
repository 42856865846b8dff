#ifndef MANAGER_SPEC_SOURCE_HPP
#define MANAGER_SPEC_SOURCE_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "proto/spec.pb.h"

namespace manager {

class SpecError : public std::runtime_error {
 public:
  explicit SpecError(const std::string& msg) : std::runtime_error(msg) {}
};

// Parses the evaluation specs in text, either one JSON object per line or a
// single JSON array. Unknown fields are ignored. Throws SpecError if a spec
// cannot be parsed, lacks a required field or repeats an instance id.
std::vector<proto::EvaluationSpec> ParseSpecs(const std::string& text);

// Reads and parses the spec file at path.
std::vector<proto::EvaluationSpec> LoadSpecs(const std::string& path);

}  // namespace manager

#endif
