#include "executor/local_executor.hpp"

#include <signal.h>

#include <cstdlib>
#include <memory>

#include "executor/harness.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

std::vector<std::string> SandboxEnvironment(const std::string& home) {
  const char* path = std::getenv("PATH");
  return {
      std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"),
      "HOME=" + home,
      "LANG=C.UTF-8",
      "OMP_NUM_THREADS=1",
      "PYTHONHASHSEED=0",
      "PYTHONDONTWRITEBYTECODE=1",
      "PYTHONIOENCODING=utf-8",
  };
}

// Protobuf strings must hold UTF-8, but the output of a program may be
// anything, and truncation may split a character. Invalid bytes become U+FFFD.
std::string SanitizeUtf8(const std::string& data) {
  static const char* kReplacement = "\xEF\xBF\xBD";
  std::string result;
  result.reserve(data.size());
  size_t i = 0;
  while (i < data.size()) {
    unsigned char c = data[i];
    size_t len = 0;
    uint32_t min_code = 0;
    if (c < 0x80) {
      result.push_back(c);
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      min_code = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      min_code = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      min_code = 0x10000;
    }
    bool valid = len != 0 && i + len <= data.size();
    uint32_t code = valid ? c & (0x7F >> len) : 0;
    for (size_t j = 1; valid && j < len; j++) {
      unsigned char next = data[i + j];
      if ((next & 0xC0) != 0x80) valid = false;
      code = (code << 6) | (next & 0x3F);
    }
    if (valid && (code < min_code || code > 0x10FFFF ||
                  (code >= 0xD800 && code <= 0xDFFF))) {
      valid = false;
    }
    if (valid) {
      result.append(data, i, len);
      i += len;
    } else {
      result.append(kReplacement);
      i++;
    }
  }
  return result;
}

}  // namespace

namespace executor {

LocalExecutor::LocalExecutor(const std::string& interpreter,
                             std::string temp_directory, bool keep_sandboxes)
    : interpreter_(util::which(interpreter)),
      temp_directory_(std::move(temp_directory)),
      keep_sandboxes_(keep_sandboxes) {
  if (interpreter_.empty()) {
    LOG(WARNING) << "Interpreter not found: " << interpreter;
    return;
  }
  // The child changes directory before exec.
  interpreter_ = util::File::AbsolutePath(interpreter_);
}

proto::ExecutionOutcome LocalExecutor::Execute(
    const proto::ExecutionUnit& unit, const LimitPolicy& policy,
    const std::atomic<bool>* cancelled) {
  proto::ExecutionOutcome outcome;
  outcome.set_problem_id(unit.problem_id());
  outcome.set_sample_index(unit.sample_index());
  outcome.set_attempts(1);

  RawExecution raw;
  try {
    Run(unit, policy, cancelled, &raw, &outcome);
  } catch (const std::exception& exc) {
    raw.launched = false;
    raw.launch_error = exc.what();
  }

  Classification classification = Classify(raw);
  outcome.set_outcome_kind(classification.kind);
  outcome.set_error_message(classification.message);
  if (classification.kind == proto::INFRA_ERROR && !raw.cancelled) {
    LOG(WARNING) << unit.problem_id() << "#" << unit.sample_index() << ": "
                 << classification.message;
  }
  return outcome;
}

void LocalExecutor::Run(const proto::ExecutionUnit& unit,
                        const LimitPolicy& policy,
                        const std::atomic<bool>* cancelled, RawExecution* raw,
                        proto::ExecutionOutcome* outcome) {
  if (interpreter_.empty()) {
    raw->launch_error = "interpreter not found";
    return;
  }

  util::TempDir tmp(temp_directory_);
  if (keep_sandboxes_) {
    tmp.Keep();
    LOG(INFO) << "Sandbox of " << unit.problem_id() << "#"
              << unit.sample_index() << " kept in " << tmp.Path();
  }
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box);
  util::File::Write(util::File::JoinPath(box, harness::kProgramFile),
                    harness::BuildProgram(unit));
  util::File::Write(util::File::JoinPath(box, harness::kRunnerFile),
                    harness::RunnerScript());

  sandbox::ExecutionOptions options(box, interpreter_);
  options.args = {"-B", harness::kRunnerFile, harness::kProgramFile};
  options.env = SandboxEnvironment(box);

  // Limits.
  options.wall_limit_millis = policy.WallLimitMillis();
  options.cpu_limit_millis = policy.CpuLimitMillis();
  options.memory_limit_kb = policy.MemoryLimitKb();
  options.max_output_bytes = policy.max_output_bytes();
  options.max_file_size_kb = kMaxFileSizeKb;
  options.max_files = kMaxFiles;
  options.cancelled = cancelled;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    raw->launch_error = "no sandbox available";
    return;
  }
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    raw->launch_error = error_msg;
    return;
  }

  raw->launched = true;
  raw->cancelled = info.cancelled;
  raw->wall_limit_exceeded = info.wall_limit_exceeded;
  raw->cpu_limit_exceeded =
      info.signal == SIGXCPU ||
      info.cpu_time_millis + info.sys_time_millis >= options.cpu_limit_millis;
  raw->memory_limit_exceeded = info.memory_limit_exceeded;
  raw->exit_code = info.status_code;
  raw->signal = info.signal;
  raw->stdout_tail = info.stdout_capture.Tail();

  outcome->set_elapsed_seconds(info.wall_time_millis / 1000.0);
  outcome->set_truncated_stdout(SanitizeUtf8(info.stdout_capture.Head()));
  outcome->set_truncated_stderr(SanitizeUtf8(info.stderr_capture.Head()));
  outcome->set_stdout_truncated(info.stdout_capture.Truncated());
  outcome->set_stderr_truncated(info.stderr_capture.Truncated());
  outcome->set_exit_code(info.status_code);
  outcome->set_signal(info.signal);
  outcome->set_memory_kb(info.memory_usage_kb);
  VLOG(1) << unit.problem_id() << "#" << unit.sample_index() << " ran in "
          << info.wall_time_millis << "ms, exit " << info.status_code
          << " signal " << info.signal << " memory " << info.memory_usage_kb
          << "KiB";
}

}  // namespace executor
