#include "manager/evaluation.hpp"

#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "core/unit_key.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/jsonl.hpp"

namespace manager {

Evaluation::Evaluation(executor::Executor* executor,
                       executor::LimitPolicy policy, EvaluationOptions options)
    : options_(std::move(options)), core_(executor, std::move(policy)) {
  ValidateOptions(options_);
  core_.SetNumCores(options_.num_workers);
  core_.SetMaxQueueSize(options_.max_queue_size);
  core_.SetMaxInfraRetries(options_.infra_retries);
  core_.SetResultCallback([this](const proto::ExecutionOutcome& outcome) {
    aggregator_.Add(outcome);
    queue_.Outcome(outcome);
  });
}

void Evaluation::ValidateOptions(const EvaluationOptions& options) {
  if (options.num_workers < 0) {
    throw std::invalid_argument(
        absl::StrCat("Negative number of workers: ", options.num_workers));
  }
  if (options.max_queue_size < 0) {
    throw std::invalid_argument(
        absl::StrCat("Negative queue size: ", options.max_queue_size));
  }
  if (options.infra_retries < 0) {
    throw std::invalid_argument(
        absl::StrCat("Negative number of retries: ", options.infra_retries));
  }
  if (options.ks.empty()) throw std::invalid_argument("No k to compute");
}

void Evaluation::Prepare(const std::vector<proto::ExecutionUnit>& units) {
  std::map<std::string, int32_t> declared;
  std::map<std::string, int32_t> counted;
  std::set<core::UnitKey> keys;
  for (const proto::ExecutionUnit& unit : units) {
    core::UnitKey key = core::UnitKey::Of(unit);
    if (key.problem_id.empty()) {
      throw std::invalid_argument("Unit without problem id");
    }
    if (!keys.insert(key).second) {
      throw std::invalid_argument("Duplicate unit " + key.ToString());
    }
    counted[unit.problem_id()]++;
    if (unit.num_samples() == 0) continue;
    auto it = declared.emplace(unit.problem_id(), unit.num_samples()).first;
    if (it->second != unit.num_samples()) {
      throw std::invalid_argument(
          absl::StrCat("Inconsistent num_samples for problem ",
                       unit.problem_id(), ": ", it->second, " and ",
                       unit.num_samples()));
    }
  }
  for (const auto& problem : counted) {
    auto it = declared.find(problem.first);
    aggregator_.ExpectProblem(
        problem.first, it == declared.end() ? problem.second : it->second);
  }
  for (const proto::ExecutionUnit& unit : units) {
    int32_t num_samples = aggregator_.Problem(unit.problem_id()).num_samples;
    if (unit.sample_index() < 0 || unit.sample_index() >= num_samples) {
      throw std::invalid_argument(
          absl::StrCat("Sample index of ", core::UnitKey::Of(unit).ToString(),
                       " outside [0, ", num_samples, ")"));
    }
  }
  aggregator_.ValidateKs(options_.ks);
  prepared_ = true;
  LOG(INFO) << "Loaded " << units.size() << " units of " << counted.size()
            << " problems, pass@k for k = "
            << absl::StrJoin(options_.ks, ", ");
}

void Evaluation::WriteOutcomes() {
  std::unique_ptr<util::JsonlWriter> writer;
  try {
    if (!options_.outcomes_path.empty()) {
      writer = absl::make_unique<util::JsonlWriter>(options_.outcomes_path);
    }
    while (auto outcome = queue_.Dequeue()) {
      if (writer) writer->Write(*outcome);
    }
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Cannot write the outcomes to " << options_.outcomes_path
               << ": " << exc.what();
    writer_error_ = exc.what();
    core_.Cancel();
    while (queue_.Dequeue()) {
    }
  }
}

proto::BenchmarkMetrics Evaluation::Run(
    std::vector<proto::ExecutionUnit> units) {
  if (!prepared_) Prepare(units);

  std::thread writer([this]() { WriteOutcomes(); });
  try {
    core_.Start();
    size_t dropped = 0;
    for (proto::ExecutionUnit& unit : units) {
      if (!core_.Enqueue(std::move(unit))) dropped++;
    }
    if (dropped > 0) {
      LOG(WARNING) << dropped << " units were not enqueued after cancellation";
    }
    core_.Wait();
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Evaluation failed: " << exc.what();
    core_.Cancel();
    queue_.Stop();
    writer.join();
    throw;
  }
  queue_.Stop();
  writer.join();
  if (!writer_error_.empty()) {
    throw std::runtime_error("Cannot write outcomes: " + writer_error_);
  }

  proto::BenchmarkMetrics metrics = aggregator_.Metrics(options_.ks);
  metrics.set_model_name(options_.model_name);
  metrics.set_benchmark(options_.benchmark);
  metrics.set_units_not_run(core_.NotRun().size());
  if (core_.Cancelled()) metrics.set_partial(true);

  LOG(INFO) << "Evaluated " << metrics.num_outcomes() << " units ("
            << metrics.infra_errors() << " infrastructure errors, "
            << metrics.units_not_run() << " not run)";
  for (const auto& pass_at_k : metrics.pass_at_k()) {
    LOG(INFO) << "pass@" << pass_at_k.first << " = " << pass_at_k.second;
  }
  LOG(INFO) << "Execution success rate "
            << metrics.execution_success_rate();
  if (metrics.partial()) LOG(WARNING) << "The results are partial";
  return metrics;
}

void Evaluation::WriteSummaries(const std::string& path) const {
  util::JsonlWriter writer(path);
  for (const proto::ProblemSummary& summary :
       aggregator_.Summaries(options_.ks)) {
    writer.Write(summary);
  }
}

void Evaluation::WriteMetrics(const std::string& path,
                              const proto::BenchmarkMetrics& metrics) {
  util::File::Write(path, util::ToJson(metrics) + "\n");
}

}  // namespace manager
