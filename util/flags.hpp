#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(specs);
DECLARE_string(results);
DECLARE_string(store_directory);
DECLARE_string(temp_directory);
DECLARE_string(test_log_dir);

DECLARE_int32(concurrency);
DECLARE_int32(test_workers);
DECLARE_int32(instance_timeout);
DECLARE_int32(agent_timeout);
DECLARE_int32(per_test_timeout);
DECLARE_int32(build_timeout);
DECLARE_int32(build_attempts);
DECLARE_int32(negative_cache_ttl);
DECLARE_int32(grace_period);

DECLARE_double(cpus);
DECLARE_int64(memory_mb);
DECLARE_string(gpus);
DECLARE_string(network);
DECLARE_string(container_runtime);

DECLARE_string(agent);
DECLARE_string(agent_mode);
DECLARE_string(agent_command);
DECLARE_string(agents);
DECLARE_string(test_command);

DECLARE_int32(patch_fuzz);
DECLARE_int32(patch_max_offset);
DECLARE_int32(max_pass_to_pass);
DECLARE_int32(max_specs_per_repo);

DECLARE_bool(resume);

#endif
