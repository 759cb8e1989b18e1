#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <string>
#include <vector>

#include "core/core.hpp"
#include "executor/executor.hpp"
#include "executor/limit_policy.hpp"
#include "manager/event_queue.hpp"
#include "manager/result_aggregator.hpp"
#include "proto/evaluation.pb.h"

namespace manager {

struct EvaluationOptions {
  std::vector<int32_t> ks{1};
  // 0 picks a default for both.
  int32_t num_workers = 0;
  int32_t max_queue_size = 0;
  int32_t infra_retries = 1;
  // JSON Lines file receiving every outcome as soon as it is produced. Empty
  // to disable.
  std::string outcomes_path;
  std::string model_name;
  std::string benchmark;
};

// Runs a batch of units on the worker pool and scores the outcomes.
class Evaluation {
 public:
  // Throws std::invalid_argument if the options are not valid.
  Evaluation(executor::Executor* executor, executor::LimitPolicy policy,
             EvaluationOptions options);

  // Throws std::invalid_argument if a worker count, queue size or retry count
  // is negative, or if ks is empty.
  static void ValidateOptions(const EvaluationOptions& options);

  Evaluation(const Evaluation&) = delete;
  Evaluation& operator=(const Evaluation&) = delete;
  Evaluation(Evaluation&&) = delete;
  Evaluation& operator=(Evaluation&&) = delete;

  // Declares the problems of the batch. Units with num_samples unset take
  // the number of units of their problem. Throws std::invalid_argument on
  // duplicate units, inconsistent sample counts or sample indexes out of
  // range, and invalid_k if a requested k exceeds the samples of a problem.
  void Prepare(const std::vector<proto::ExecutionUnit>& units);

  // Prepares and runs the units, then returns the metrics. The metrics are
  // partial if the run was cancelled.
  proto::BenchmarkMetrics Run(std::vector<proto::ExecutionUnit> units);

  // Thread safe. Outcomes produced so far are kept.
  void Cancel() { core_.Cancel(); }
  bool Cancelled() const { return core_.Cancelled(); }

  const ResultAggregator& Aggregator() const { return aggregator_; }

  // Writes the summary of every problem, one JSON object per line.
  void WriteSummaries(const std::string& path) const;

  // Writes the metrics as a JSON object.
  static void WriteMetrics(const std::string& path,
                           const proto::BenchmarkMetrics& metrics);

 private:
  void WriteOutcomes();

  EvaluationOptions options_;
  ResultAggregator aggregator_;
  EventQueue queue_;
  std::string writer_error_;
  bool prepared_ = false;
  core::Core core_;
};

}  // namespace manager

#endif  // MANAGER_EVALUATION_HPP
