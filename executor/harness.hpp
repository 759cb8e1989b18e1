#ifndef EXECUTOR_HARNESS_HPP
#define EXECUTOR_HARNESS_HPP

#include <string>

#include "proto/evaluation.pb.h"

namespace executor {
namespace harness {

// Every run of the runner script ends by printing a line made of this prefix,
// a space and one of the verdicts below.
static const constexpr char* kMarkerPrefix = "@@codeeval/v1";

enum class Verdict { NONE, PASSED, FAILED, ERRORED, MEMORY };

// Exit codes of the runner script for each verdict.
static const constexpr int kPassedExitCode = 0;
static const constexpr int kFailedExitCode = 1;
static const constexpr int kErroredExitCode = 2;
static const constexpr int kMemoryExitCode = 3;

static const constexpr char* kProgramFile = "program.py";
static const constexpr char* kRunnerFile = "runner.py";

// The file executed for a unit: the generated code, then the test harness,
// then a call to check(entry_point) when the unit names an entry point.
std::string BuildProgram(const proto::ExecutionUnit& unit);

// Python script that runs the program given as its first argument and
// reports the verdict with the marker line.
const std::string& RunnerScript();

// Finds the last marker line in the given output.
Verdict ParseVerdict(const std::string& output);

int ExitCodeFor(Verdict verdict);
const char* VerdictName(Verdict verdict);

}  // namespace harness
}  // namespace executor

#endif
