#include "executor/harness.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace executor {
namespace harness {

namespace {
const constexpr char* kRunnerScript = R"(import os
import runpy
import sys
import traceback

MARKER = "@@codeeval/v1"


def finish(verdict, code):
    for stream in (sys.stdout, sys.stderr):
        try:
            stream.flush()
        except Exception:
            pass
    try:
        os.write(1, ("\n%s %s\n" % (MARKER, verdict)).encode())
    except OSError:
        pass
    os._exit(code)


def main():
    try:
        runpy.run_path(sys.argv[1], run_name="__main__")
    except SystemExit as exc:
        if exc.code is None or exc.code == 0:
            finish("passed", 0)
        traceback.print_exc()
        finish("errored", 2)
    except AssertionError:
        traceback.print_exc()
        finish("failed", 1)
    except MemoryError:
        finish("memory", 3)
    except BaseException:
        traceback.print_exc()
        finish("errored", 2)
    finish("passed", 0)


main()
)";
}  // namespace

std::string BuildProgram(const proto::ExecutionUnit& unit) {
  std::string program =
      absl::StrCat(unit.generated_code(), "\n\n", unit.harness_code(), "\n\n");
  if (!unit.entry_point().empty()) {
    absl::StrAppend(&program, "check(", unit.entry_point(), ")\n");
  }
  return program;
}

const std::string& RunnerScript() {
  static const std::string* script = new std::string(kRunnerScript);
  return *script;
}

Verdict ParseVerdict(const std::string& output) {
  Verdict verdict = Verdict::NONE;
  for (absl::string_view line : absl::StrSplit(output, '\n')) {
    if (!absl::ConsumePrefix(&line, kMarkerPrefix)) continue;
    if (!absl::ConsumePrefix(&line, " ")) continue;
    line = absl::StripSuffix(line, "\r");
    if (line == "passed") {
      verdict = Verdict::PASSED;
    } else if (line == "failed") {
      verdict = Verdict::FAILED;
    } else if (line == "errored") {
      verdict = Verdict::ERRORED;
    } else if (line == "memory") {
      verdict = Verdict::MEMORY;
    }
  }
  return verdict;
}

int ExitCodeFor(Verdict verdict) {
  switch (verdict) {
    case Verdict::PASSED:
      return kPassedExitCode;
    case Verdict::FAILED:
      return kFailedExitCode;
    case Verdict::MEMORY:
      return kMemoryExitCode;
    case Verdict::ERRORED:
    case Verdict::NONE:
      break;
  }
  return kErroredExitCode;
}

const char* VerdictName(Verdict verdict) {
  switch (verdict) {
    case Verdict::PASSED:
      return "passed";
    case Verdict::FAILED:
      return "failed";
    case Verdict::ERRORED:
      return "errored";
    case Verdict::MEMORY:
      return "memory";
    case Verdict::NONE:
      break;
  }
  return "none";
}

}  // namespace harness
}  // namespace executor
