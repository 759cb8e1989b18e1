#include "util/flags.hpp"

DEFINE_string(units, "", "JSONL file with the execution units to evaluate");
DEFINE_string(outcomes, "evaluations.jsonl",
              "Where the outcome of each unit should be written (JSONL)");
DEFINE_string(result, "result.json",
              "Where the aggregated metrics should be written");
DEFINE_string(problems, "problems.jsonl",
              "Where the summary of each problem should be written (JSONL). "
              "Empty to disable");
DEFINE_string(model_name, "", "Name of the evaluated model, for the result");
DEFINE_string(benchmark, "", "Name of the benchmark, for the result");
DEFINE_string(pass_at_k, "1", "Comma-separated list of k values for pass@k");

DEFINE_double(timeout, 3.0, "Wall clock limit of a single execution, seconds");
DEFINE_int64(memory_limit_mb, 1024, "Address space limit of an execution");
DEFINE_int64(max_output_bytes, 64 * 1024,
             "Bytes of stdout and stderr kept for each execution");

DEFINE_int32(num_workers, 0,
             "Number of parallel executions. If unset, autodetect");
DEFINE_int32(max_queue_size, 0,
             "Pending units before producers block. If unset, twice the "
             "number of workers");
DEFINE_int32(infra_retries, 1,
             "How many times a unit that hit an infrastructure error is "
             "dispatched again");

DEFINE_string(interpreter, "python3", "Interpreter used to run the samples");
DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false, "Do not delete sandboxes after execution");
