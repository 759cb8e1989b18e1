#ifndef MANAGER_RESULT_AGGREGATOR_HPP
#define MANAGER_RESULT_AGGREGATOR_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/evaluation.pb.h"

namespace manager {

// The outcomes collected for one problem, ordered by sample index.
struct ProblemResult {
  std::string problem_id;
  int32_t num_samples = 0;
  std::map<int32_t, proto::ExecutionOutcome> outcomes;

  int32_t n() const { return outcomes.size(); }
  int32_t c() const;
  int32_t infra_errors() const;
  // All the configured samples have an outcome.
  bool Finalized() const { return n() == num_samples; }
};

// Collects outcomes as they are produced, in any order and from any thread,
// and turns them into per-problem and benchmark-wide metrics.
class ResultAggregator {
 public:
  // Declares a problem and the number of samples it will receive. Throws
  // std::invalid_argument if num_samples is not positive or differs from a
  // previous declaration.
  void ExpectProblem(const std::string& problem_id, int32_t num_samples);

  // Stores an outcome. Returns false, keeping the stored one, if an outcome
  // for the same sample was already recorded. Throws std::invalid_argument
  // for undeclared problems or sample indexes outside [0, num_samples).
  bool Add(const proto::ExecutionOutcome& outcome);

  // Throws invalid_k if some k is not positive or exceeds the number of
  // samples of a declared problem.
  void ValidateKs(const std::vector<int32_t>& ks) const;

  // Summary of every problem, ordered by id. pass@k is reported for the
  // finalized problems having at least k outcomes that are not
  // infrastructure errors.
  std::vector<proto::ProblemSummary> Summaries(
      const std::vector<int32_t>& ks) const;

  // Benchmark-wide metrics. pass@k is the mean over finalized problems;
  // infrastructure errors do not count as samples, and problems left with
  // fewer than k samples are excluded from pass@k and counted in
  // excluded_problems. The result is partial when some problem is not
  // finalized.
  proto::BenchmarkMetrics Metrics(const std::vector<int32_t>& ks) const;

  ProblemResult Problem(const std::string& problem_id) const;
  size_t NumProblems() const;

 private:
  mutable absl::Mutex mutex_;
  std::map<std::string, ProblemResult> problems_ GUARDED_BY(mutex_);
};

}  // namespace manager

#endif
