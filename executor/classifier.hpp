#ifndef EXECUTOR_CLASSIFIER_HPP
#define EXECUTOR_CLASSIFIER_HPP

#include <string>

#include "proto/evaluation.pb.h"

namespace executor {

// What the sandbox observed about a single execution.
struct RawExecution {
  // False if the process could not be started; launch_error says why.
  bool launched = false;
  std::string launch_error;

  bool cancelled = false;
  bool wall_limit_exceeded = false;
  bool cpu_limit_exceeded = false;
  bool memory_limit_exceeded = false;

  int exit_code = 0;
  int signal = 0;
  // End of the standard output, where the runner writes its verdict.
  std::string stdout_tail;
};

struct Classification {
  proto::OutcomeKind kind;
  std::string message;
};

// Maps the observations to exactly one outcome kind. The first matching rule
// wins: launch failures and cancellation, timeouts, memory exhaustion and
// signals, then the verdict printed by the runner.
Classification Classify(const RawExecution& raw);

}  // namespace executor

#endif
