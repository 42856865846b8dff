#include "util/flags.hpp"

DEFINE_string(specs, "", "JSON-lines file with the evaluation specs to run");
DEFINE_string(results, "results.jsonl", "Where the results log is appended");
DEFINE_string(store_directory, "files",
              "Where the image store and agent workspaces are kept");
DEFINE_string(temp_directory, "temp", "Where temporary files are created");
DEFINE_string(test_log_dir, "logs",
              "Where per-test execution logs are written");

DEFINE_int32(concurrency, 4, "Number of specs evaluated in parallel");
DEFINE_int32(test_workers, 4, "Number of tests run in parallel per phase");
DEFINE_int32(instance_timeout, 3600,
             "Wall clock budget in seconds of a single spec pipeline");
DEFINE_int32(agent_timeout, 1800, "Agent run timeout in seconds");
DEFINE_int32(per_test_timeout, 60, "Timeout of a single test in seconds");
DEFINE_int32(build_timeout, 1800, "Image build timeout in seconds");
DEFINE_int32(build_attempts, 2, "How many times a failing build is attempted");
DEFINE_int32(negative_cache_ttl, 300,
             "Seconds a failed build is remembered before it is retried");
DEFINE_int32(grace_period, 30,
             "Seconds in-flight stages are given after a stop request");

DEFINE_double(cpus, 0, "CPUs available to each instance, 0 for no limit");
DEFINE_int64(memory_mb, 0, "Memory limit of each instance, 0 for no limit");
DEFINE_string(gpus, "", "Accelerators visible to instances (docker --gpus)");
DEFINE_string(network, "", "Network mode of instances, empty for default");
DEFINE_string(container_runtime, "docker", "Container engine executable");

DEFINE_string(agent, "agent", "Name of the evaluated agent");
DEFINE_string(agent_mode, "container",
              "Where the agent runs: container or local");
DEFINE_string(agent_command, "",
              "Agent command template. {prompt}, {workspace} and "
              "{instance_id} are substituted");
DEFINE_string(agents, "",
              "JSON file listing the agents to evaluate, as "
              "{\"agents\": [{\"name\", \"mode\", \"command\"}]}. "
              "Replaces --agent, --agent_mode and --agent_command");
DEFINE_string(test_command,
              "python3 -m pytest -q -rA --tb=no -p no:cacheprovider {test}",
              "Default command running one test. {test} is substituted");

DEFINE_int32(patch_fuzz, 2, "Context lines that may be ignored per hunk end");
DEFINE_int32(patch_max_offset, 200,
             "Maximum line drift searched when placing a hunk");
DEFINE_int32(max_pass_to_pass, 50,
             "Maximum number of derived PASS_TO_PASS tests");
DEFINE_int32(max_specs_per_repo, 0,
             "Evaluate at most this many specs of each repository, in file "
             "order. 0 for no limit");

DEFINE_bool(resume, false, "Skip specs already done in the results log");
