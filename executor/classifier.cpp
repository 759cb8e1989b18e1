#include "executor/classifier.hpp"

#include <string.h>

#include "absl/strings/str_cat.h"
#include "executor/harness.hpp"

namespace executor {

Classification Classify(const RawExecution& raw) {
  if (!raw.launched) {
    return {proto::INFRA_ERROR, "Execution failed: " + raw.launch_error};
  }
  if (raw.cancelled) {
    return {proto::INFRA_ERROR, "Execution cancelled"};
  }
  if (raw.wall_limit_exceeded) {
    return {proto::TIMED_OUT, "Wall limit exceeded"};
  }
  if (raw.cpu_limit_exceeded) {
    return {proto::TIMED_OUT, "CPU limit exceeded"};
  }
  if (raw.memory_limit_exceeded) {
    return {proto::CRASHED, "Memory limit exceeded"};
  }
  if (raw.signal) {
    const char* name = strsignal(raw.signal);
    return {proto::CRASHED,
            absl::StrCat("Killed by signal ", raw.signal, " (",
                         name ? name : "unknown", ")")};
  }

  harness::Verdict verdict = harness::ParseVerdict(raw.stdout_tail);
  if (verdict == harness::Verdict::NONE) {
    return {proto::ERRORED,
            absl::StrCat("Exited with code ", raw.exit_code,
                         " without reporting a result")};
  }
  if (raw.exit_code != harness::ExitCodeFor(verdict)) {
    return {proto::ERRORED,
            absl::StrCat("Reported ", harness::VerdictName(verdict),
                         " but exited with code ", raw.exit_code)};
  }
  switch (verdict) {
    case harness::Verdict::PASSED:
      return {proto::PASSED, ""};
    case harness::Verdict::FAILED:
      return {proto::FAILED, "Assertion failed"};
    case harness::Verdict::MEMORY:
      return {proto::CRASHED, "Memory limit exceeded"};
    case harness::Verdict::ERRORED:
    case harness::Verdict::NONE:
      break;
  }
  return {proto::ERRORED, "Uncaught exception"};
}

}  // namespace executor
