#include <signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include "absl/memory/memory.h"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "manager/pass_at_k.hpp"
#include "util/flags.hpp"
#include "util/jsonl.hpp"

namespace {
const auto SIGNAL_POLL_INTERVAL = std::chrono::milliseconds(100);  // NOLINT

const constexpr int kExitFailure = 1;
const constexpr int kExitPartial = 2;

std::atomic<int> received_signal{0};

void HandleSignal(int signum) { received_signal = signum; }

void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = HandleSignal;
  sigemptyset(&action.sa_mask);
  for (int signum : {SIGINT, SIGTERM}) {
    if (sigaction(signum, &action, nullptr) == -1) {
      PLOG(FATAL) << "sigaction";
    }
  }
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs generated code samples against their harness and computes "
      "pass@k.\nUsage: codeeval --units=units.jsonl [flags]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (FLAGS_units.empty()) {
    LOG(ERROR) << "--units is required";
    return kExitFailure;
  }

  manager::EvaluationOptions options;
  options.num_workers = FLAGS_num_workers;
  options.max_queue_size = FLAGS_max_queue_size;
  options.infra_retries = FLAGS_infra_retries;
  options.outcomes_path = FLAGS_outcomes;
  options.model_name = FLAGS_model_name;
  options.benchmark = FLAGS_benchmark;

  std::unique_ptr<executor::LimitPolicy> policy;
  std::vector<proto::ExecutionUnit> units;
  try {
    options.ks = manager::ParseKs(FLAGS_pass_at_k);
    manager::Evaluation::ValidateOptions(options);
    policy = absl::make_unique<executor::LimitPolicy>(
        FLAGS_timeout, FLAGS_memory_limit_mb * 1024 * 1024,
        FLAGS_max_output_bytes);
    units = util::ReadJsonl<proto::ExecutionUnit>(FLAGS_units);
  } catch (const std::invalid_argument& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return kExitFailure;
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Cannot read the units: " << exc.what();
    return kExitFailure;
  } catch (const util::json_error& exc) {
    LOG(ERROR) << "Cannot parse the units: " << exc.what();
    return kExitFailure;
  }

  executor::LocalExecutor executor(FLAGS_interpreter, FLAGS_temp_directory,
                                   FLAGS_keep_sandboxes);
  if (executor.Interpreter().empty()) {
    LOG(ERROR) << "Cannot find the interpreter " << FLAGS_interpreter;
    return kExitFailure;
  }
  LOG(INFO) << "Using " << executor.Interpreter() << ", "
            << policy->DebugString();

  manager::Evaluation evaluation(&executor, *policy, options);
  try {
    evaluation.Prepare(units);
  } catch (const std::invalid_argument& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return kExitFailure;
  }

  // Turns SIGINT and SIGTERM into a cancellation of the run.
  InstallSignalHandlers();
  bool finished = false;
  std::mutex finished_mutex;
  std::condition_variable finished_cv;
  std::thread watcher([&]() {
    std::unique_lock<std::mutex> lck(finished_mutex);
    while (!finished) {
      if (received_signal != 0) {
        LOG(WARNING) << "Received signal " << received_signal
                     << ", stopping the evaluation";
        evaluation.Cancel();
        return;
      }
      finished_cv.wait_for(lck, SIGNAL_POLL_INTERVAL);
    }
  });

  proto::BenchmarkMetrics metrics;
  int status = 0;
  try {
    metrics = evaluation.Run(std::move(units));
    manager::Evaluation::WriteMetrics(FLAGS_result, metrics);
    LOG(INFO) << "Metrics written to " << FLAGS_result;
    if (!FLAGS_problems.empty()) {
      evaluation.WriteSummaries(FLAGS_problems);
      LOG(INFO) << "Problem summaries written to " << FLAGS_problems;
    }
  } catch (const std::exception& exc) {
    LOG(ERROR) << "The evaluation failed: " << exc.what();
    status = kExitFailure;
  }
  {
    std::lock_guard<std::mutex> lck(finished_mutex);
    finished = true;
  }
  finished_cv.notify_all();
  watcher.join();

  if (status == 0 && metrics.partial()) status = kExitPartial;
  return status;
}
