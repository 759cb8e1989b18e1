#include "core/core.hpp"

#include <stdexcept>

#include "glog/logging.h"

namespace core {

Core::~Core() {
  if (threads_.empty()) return;
  Cancel();
  StopThreads();
}

void Core::Start() {
  std::lock_guard<std::mutex> lck(task_mutex_);
  if (started_) throw std::logic_error("Core already started");
  started_ = true;
  quitting_ = false;
  if (max_queue_size_ == 0) max_queue_size_ = 2 * num_cores_;
  LOG(INFO) << "Starting " << num_cores_ << " workers, "
            << policy_.DebugString();
  for (int i = 0; i < num_cores_; i++)
    threads_.emplace_back(std::bind(&Core::ThreadBody, this));
}

bool Core::Enqueue(proto::ExecutionUnit unit) {
  UnitKey key = UnitKey::Of(unit);
  if (key.problem_id.empty()) {
    throw std::invalid_argument("Unit without problem id");
  }
  if (key.sample_index < 0) {
    throw std::invalid_argument("Negative sample index for " +
                                key.ToString());
  }
  std::unique_lock<std::mutex> lck(task_mutex_);
  if (!started_) throw std::logic_error("Enqueue called before Start");
  if (input_closed_) throw std::logic_error("Enqueue called after CloseInput");
  if (!known_units_.insert(key).second) {
    throw std::invalid_argument("Duplicate unit " + key.ToString());
  }
  while (!cancelled_ && tasks_.size() >= max_queue_size_) {
    space_ready_.wait(lck);
  }
  if (cancelled_) {
    not_run_.push_back(std::move(key));
    return false;
  }
  tasks_.push_back(PendingUnit{std::move(unit), 0});
  task_ready_.notify_one();
  return true;
}

void Core::CloseInput() {
  std::lock_guard<std::mutex> lck(task_mutex_);
  input_closed_ = true;
  task_ready_.notify_all();
  idle_.notify_all();
}

void Core::Wait() {
  CloseInput();
  {
    std::unique_lock<std::mutex> lck(task_mutex_);
    idle_.wait(lck, [this]() {
      return in_flight_ == 0 && (cancelled_ || tasks_.empty());
    });
  }
  StopThreads();
  std::lock_guard<std::mutex> lck(task_mutex_);
  if (!callback_error_.empty()) {
    throw std::runtime_error("Result callback failed: " + callback_error_);
  }
}

void Core::StopThreads() {
  quitting_ = true;
  task_ready_.notify_all();
  for (std::thread& thread : threads_) thread.join();
  threads_.clear();
}

void Core::Cancel() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    if (cancelled_) return;
    cancelled_ = true;
    dropped = tasks_.size();
    for (PendingUnit& task : tasks_) {
      not_run_.push_back(UnitKey::Of(task.unit));
    }
    tasks_.clear();
  }
  LOG(WARNING) << "Cancelling the run: " << dropped
               << " queued units will not be executed";
  task_ready_.notify_all();
  space_ready_.notify_all();
  idle_.notify_all();
}

proto::ExecutionOutcome Core::ExecuteTask(const proto::ExecutionUnit& unit) {
  try {
    return executor_->Execute(unit, policy_, &cancelled_);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Executor " << executor_->Id() << " failed on "
               << UnitKey::Of(unit).ToString() << ": " << exc.what();
    proto::ExecutionOutcome outcome;
    outcome.set_problem_id(unit.problem_id());
    outcome.set_sample_index(unit.sample_index());
    outcome.set_outcome_kind(proto::INFRA_ERROR);
    outcome.set_error_message(exc.what());
    return outcome;
  }
}

void Core::Publish(const proto::ExecutionOutcome& outcome) {
  if (!callback_) return;
  try {
    callback_(outcome);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Result callback failed for "
               << UnitKey::Of(outcome).ToString() << ": " << exc.what();
    {
      std::lock_guard<std::mutex> lck(task_mutex_);
      if (callback_error_.empty()) callback_error_ = exc.what();
    }
    Cancel();
  }
}

void Core::ThreadBody() {
  while (!quitting_) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && !cancelled_ && !input_closed_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    if (quitting_ || cancelled_ || tasks_.empty()) break;
    PendingUnit task = std::move(tasks_.front());
    tasks_.pop_front();
    UnitKey key = UnitKey::Of(task.unit);
    running_tasks_.emplace(key, RunningTaskInfo(key, task.attempts + 1));
    in_flight_++;
    space_ready_.notify_one();
    lck.unlock();

    VLOG(1) << "Executing " << key.ToString() << " (attempt "
            << task.attempts + 1 << ")";
    proto::ExecutionOutcome outcome = ExecuteTask(task.unit);
    outcome.set_attempts(task.attempts + 1);
    VLOG(1) << "Execution completed: " << key.ToString() << " "
            << proto::OutcomeKind_Name(outcome.outcome_kind());

    lck.lock();
    running_tasks_.erase(key);
    if (outcome.outcome_kind() == proto::INFRA_ERROR && !cancelled_ &&
        task.attempts < max_infra_retries_) {
      LOG(WARNING) << "Retrying " << key.ToString() << " after "
                   << outcome.error_message();
      task.attempts++;
      tasks_.push_front(std::move(task));
      in_flight_--;
      task_ready_.notify_one();
      continue;
    }
    results_.emplace(key, outcome);
    lck.unlock();

    Publish(outcome);

    lck.lock();
    CHECK_GT(in_flight_, 0u) << "Completed " << key.ToString()
                             << " with no unit in flight";
    in_flight_--;
    idle_.notify_all();
  }
}

std::vector<RunningTaskInfo> Core::RunningTasks() const {
  std::lock_guard<std::mutex> lck(task_mutex_);
  std::vector<RunningTaskInfo> tasks;
  for (const auto& task : running_tasks_) tasks.push_back(task.second);
  return tasks;
}

std::vector<UnitResult> Core::Results() const {
  std::lock_guard<std::mutex> lck(task_mutex_);
  std::vector<UnitResult> results;
  for (const auto& result : results_) {
    results.push_back(UnitResult{result.first, result.second});
  }
  return results;
}

std::vector<UnitKey> Core::NotRun() const {
  std::lock_guard<std::mutex> lck(task_mutex_);
  return not_run_;
}

std::vector<UnitResult> Core::Run(std::vector<proto::ExecutionUnit> units) {
  Start();
  auto cleanup = [this]() {
    Cancel();
    StopThreads();
  };
  try {
    for (proto::ExecutionUnit& unit : units) Enqueue(std::move(unit));
    Wait();
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Run aborted: " << exc.what();
    cleanup();
    throw;
  }
  return Results();
}

std::vector<UnitResult> RunAll(executor::Executor* executor,
                               std::vector<proto::ExecutionUnit> units,
                               const executor::LimitPolicy& policy,
                               int32_t concurrency) {
  Core core(executor, policy);
  core.SetNumCores(concurrency);
  return core.Run(std::move(units));
}

}  // namespace core
