#ifndef MANAGER_PYTEST_PARSER_HPP
#define MANAGER_PYTEST_PARSER_HPP

#include <map>
#include <string>

#include "absl/types/optional.h"
#include "proto/result.pb.h"

namespace manager {

// Per-test statuses reported by pytest -rA, keyed by node id. Only the
// "short test summary info" section is read when present, every line of the
// output otherwise. ERROR entries are reported as failures.
std::map<std::string, proto::TestStatus> ParsePytestOutput(
    const std::string& output);

// Status of test_id in results. Parametrized results ("test_x[1]",
// "test_x[2]") are aggregated when test_id has no parameters: any failure
// fails the test, otherwise it passes if any case passed. A collection error
// of the file holding test_id fails it too.
absl::optional<proto::TestStatus> PytestStatus(
    const std::map<std::string, proto::TestStatus>& results,
    const std::string& test_id);

}  // namespace manager

#endif
