#include "manager/result_aggregator.hpp"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "manager/pass_at_k.hpp"

namespace manager {

namespace {
bool IsExecutionFailure(proto::OutcomeKind kind) {
  return kind == proto::ERRORED || kind == proto::TIMED_OUT ||
         kind == proto::CRASHED || kind == proto::INFRA_ERROR;
}

const proto::OutcomeKind kAllKinds[] = {
    proto::PASSED,    proto::FAILED,  proto::ERRORED,
    proto::TIMED_OUT, proto::CRASHED, proto::INFRA_ERROR};
}  // namespace

int32_t ProblemResult::c() const {
  return std::count_if(outcomes.begin(), outcomes.end(), [](const auto& o) {
    return o.second.outcome_kind() == proto::PASSED;
  });
}

int32_t ProblemResult::infra_errors() const {
  return std::count_if(outcomes.begin(), outcomes.end(), [](const auto& o) {
    return o.second.outcome_kind() == proto::INFRA_ERROR;
  });
}

void ResultAggregator::ExpectProblem(const std::string& problem_id,
                                     int32_t num_samples) {
  if (num_samples <= 0) {
    throw std::invalid_argument(absl::StrCat(
        "Problem ", problem_id, " has invalid num_samples ", num_samples));
  }
  absl::MutexLock lck(&mutex_);
  auto it = problems_.find(problem_id);
  if (it == problems_.end()) {
    ProblemResult problem;
    problem.problem_id = problem_id;
    problem.num_samples = num_samples;
    problems_.emplace(problem_id, std::move(problem));
    return;
  }
  if (it->second.num_samples != num_samples) {
    throw std::invalid_argument(
        absl::StrCat("Problem ", problem_id, " declared with ", num_samples,
                     " samples, previously ", it->second.num_samples));
  }
}

bool ResultAggregator::Add(const proto::ExecutionOutcome& outcome) {
  absl::MutexLock lck(&mutex_);
  auto it = problems_.find(outcome.problem_id());
  if (it == problems_.end()) {
    throw std::invalid_argument("Outcome for unknown problem " +
                                outcome.problem_id());
  }
  ProblemResult& problem = it->second;
  if (outcome.sample_index() < 0 ||
      outcome.sample_index() >= problem.num_samples) {
    throw std::invalid_argument(absl::StrCat(
        "Sample ", outcome.sample_index(), " of ", outcome.problem_id(),
        " outside [0, ", problem.num_samples, ")"));
  }
  if (!problem.outcomes.emplace(outcome.sample_index(), outcome).second) {
    LOG(WARNING) << "Ignoring duplicate outcome for " << outcome.problem_id()
                 << "#" << outcome.sample_index();
    return false;
  }
  if (problem.Finalized()) {
    VLOG(1) << "Problem " << problem.problem_id << " finalized: "
            << problem.c() << "/" << problem.n() << " passed";
  }
  return true;
}

void ResultAggregator::ValidateKs(const std::vector<int32_t>& ks) const {
  absl::MutexLock lck(&mutex_);
  for (int32_t k : ks) {
    if (k <= 0) throw invalid_k(absl::StrCat("k must be positive, got ", k));
    for (const auto& problem : problems_) {
      if (problem.second.num_samples < k) {
        throw invalid_k(absl::StrCat("pass@", k, " requested but problem ",
                                     problem.first, " has only ",
                                     problem.second.num_samples, " samples"));
      }
    }
  }
}

std::vector<proto::ProblemSummary> ResultAggregator::Summaries(
    const std::vector<int32_t>& ks) const {
  absl::MutexLock lck(&mutex_);
  std::vector<proto::ProblemSummary> summaries;
  for (const auto& entry : problems_) {
    const ProblemResult& problem = entry.second;
    proto::ProblemSummary summary;
    summary.set_problem_id(problem.problem_id);
    summary.set_num_samples(problem.num_samples);
    summary.set_n(problem.n());
    summary.set_c(problem.c());
    summary.set_infra_errors(problem.infra_errors());
    summary.set_finalized(problem.Finalized());
    if (problem.Finalized()) {
      int64_t valid = problem.n() - problem.infra_errors();
      for (int32_t k : ks) {
        if (k > 0 && valid >= k) {
          (*summary.mutable_pass_at_k())[k] = PassAtK(valid, problem.c(), k);
        }
      }
    }
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

proto::BenchmarkMetrics ResultAggregator::Metrics(
    const std::vector<int32_t>& ks) const {
  absl::MutexLock lck(&mutex_);
  proto::BenchmarkMetrics metrics;
  std::map<proto::OutcomeKind, int64_t> kind_counts;
  std::map<int32_t, std::vector<SampleCounts>> included;
  int64_t num_outcomes = 0;
  int64_t successful_executions = 0;
  int32_t num_samples = 0;

  for (const auto& entry : problems_) {
    const ProblemResult& problem = entry.second;
    num_samples = std::max(num_samples, problem.num_samples);
    for (const auto& outcome : problem.outcomes) {
      proto::OutcomeKind kind = outcome.second.outcome_kind();
      kind_counts[kind]++;
      num_outcomes++;
      if (!IsExecutionFailure(kind)) successful_executions++;
    }
    if (!problem.Finalized()) {
      metrics.set_incomplete_problems(metrics.incomplete_problems() + 1);
      continue;
    }
    metrics.set_complete_problems(metrics.complete_problems() + 1);
    SampleCounts counts{problem.n() - problem.infra_errors(), problem.c()};
    for (int32_t k : ks) {
      if (counts.n >= k) {
        included[k].push_back(counts);
      } else {
        (*metrics.mutable_excluded_problems())[k]++;
      }
    }
  }

  // A k without any eligible problem has no score.
  for (int32_t k : ks) {
    if (included[k].empty()) continue;
    (*metrics.mutable_pass_at_k())[k] = MeanPassAtK(included[k], k);
  }
  if (!ks.empty() && metrics.pass_at_k().count(ks.front())) {
    metrics.set_score(metrics.pass_at_k().at(ks.front()));
  }
  metrics.set_execution_success_rate(
      num_outcomes ? static_cast<double>(successful_executions) / num_outcomes
                   : 0);
  for (proto::OutcomeKind kind : kAllKinds) {
    proto::KindCount* count = metrics.add_outcome_counts();
    count->set_kind(kind);
    count->set_count(kind_counts[kind]);
  }
  metrics.set_num_outcomes(num_outcomes);
  metrics.set_infra_errors(kind_counts[proto::INFRA_ERROR]);
  metrics.set_num_samples(num_samples);
  metrics.set_total_problems(problems_.size());
  metrics.set_partial(metrics.incomplete_problems() > 0);
  return metrics;
}

ProblemResult ResultAggregator::Problem(const std::string& problem_id) const {
  absl::MutexLock lck(&mutex_);
  auto it = problems_.find(problem_id);
  if (it == problems_.end()) {
    throw std::invalid_argument("Unknown problem " + problem_id);
  }
  return it->second;
}

size_t ResultAggregator::NumProblems() const {
  absl::MutexLock lck(&mutex_);
  return problems_.size();
}

}  // namespace manager
