#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Input and output.
DECLARE_string(units);
DECLARE_string(outcomes);
DECLARE_string(result);
DECLARE_string(problems);
DECLARE_string(model_name);
DECLARE_string(benchmark);
DECLARE_string(pass_at_k);

// Limits.
DECLARE_double(timeout);
DECLARE_int64(memory_limit_mb);
DECLARE_int64(max_output_bytes);

// Scheduling.
DECLARE_int32(num_workers);
DECLARE_int32(max_queue_size);
DECLARE_int32(infra_retries);

// Sandbox.
DECLARE_string(interpreter);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

#endif
