#ifndef CORE_CORE_HPP
#define CORE_CORE_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "core/running_task.hpp"
#include "core/unit_key.hpp"
#include "executor/executor.hpp"
#include "executor/limit_policy.hpp"
#include "proto/evaluation.pb.h"

namespace core {

struct UnitResult {
  UnitKey key;
  proto::ExecutionOutcome outcome;
};

// Runs execution units on a fixed number of worker threads, each of them
// driving one sandboxed process at a time. Units are taken from a bounded
// queue: Enqueue blocks while the queue is full.
//
// Typical usage:
//   Core core(&executor, policy);
//   core.SetNumCores(8);
//   core.Start();
//   for (...) core.Enqueue(unit);
//   core.Wait();
//   auto results = core.Results();
class Core {
 public:
  using ResultCallback = std::function<void(const proto::ExecutionOutcome&)>;

  Core(executor::Executor* executor, executor::LimitPolicy policy)
      : executor_(executor),
        policy_(std::move(policy)),
        num_cores_(std::thread::hardware_concurrency()) {}
  ~Core();

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;
  Core(Core&&) = delete;
  Core& operator=(Core&&) = delete;

  void SetNumCores(int32_t num_cores) {
    num_cores_ = num_cores;
    if (num_cores_ <= 0) {
      num_cores_ = std::thread::hardware_concurrency();
    }
    if (num_cores_ <= 0) num_cores_ = 1;
  }
  // Maximum number of units waiting for a worker. Zero means twice the number
  // of cores.
  void SetMaxQueueSize(size_t max_queue_size) {
    max_queue_size_ = max_queue_size;
  }
  // How many times a unit whose execution ended with an infrastructure error
  // is dispatched again before its outcome is published.
  void SetMaxInfraRetries(int32_t retries) { max_infra_retries_ = retries; }
  // Called from the worker threads with the final outcome of every unit.
  // Must be set before Start.
  void SetResultCallback(ResultCallback callback) {
    callback_ = std::move(callback);
  }

  int32_t NumCores() const { return num_cores_; }

  // Starts the worker threads.
  void Start();

  // Adds a unit to the queue, blocking while the queue is full. Returns false
  // if the run was cancelled, in which case the unit will not be run. Throws
  // std::invalid_argument if a unit with the same key was already enqueued.
  bool Enqueue(proto::ExecutionUnit unit);

  // Signals that no more units will be enqueued.
  void CloseInput();

  // Closes the input and blocks until every enqueued unit has an outcome, or
  // until the in-flight units of a cancelled run are stopped. Joins the
  // worker threads. Throws std::runtime_error if the result callback failed.
  void Wait();

  // Stops dispatching units and kills the running executions, whose outcome
  // becomes an infrastructure error. Outcomes already produced are kept.
  // Thread safe, may be called more than once.
  void Cancel();
  bool Cancelled() const { return cancelled_; }

  // Units currently being executed.
  std::vector<RunningTaskInfo> RunningTasks() const;

  // Final outcomes, ordered by key.
  std::vector<UnitResult> Results() const;

  // Units that were enqueued (or offered to Enqueue) but never dispatched
  // because the run was cancelled.
  std::vector<UnitKey> NotRun() const;

  // Runs all the units and returns one result for each unit that was
  // dispatched, ordered by key.
  std::vector<UnitResult> Run(std::vector<proto::ExecutionUnit> units);

 private:
  struct PendingUnit {
    proto::ExecutionUnit unit;
    int32_t attempts;
  };

  proto::ExecutionOutcome ExecuteTask(const proto::ExecutionUnit& unit);
  void Publish(const proto::ExecutionOutcome& outcome);
  void StopThreads();
  void ThreadBody();

  executor::Executor* executor_;
  const executor::LimitPolicy policy_;
  int32_t num_cores_;
  size_t max_queue_size_ = 0;
  int32_t max_infra_retries_ = 1;
  ResultCallback callback_;

  mutable std::mutex task_mutex_;
  std::condition_variable task_ready_;
  std::condition_variable space_ready_;
  std::condition_variable idle_;
  std::deque<PendingUnit> tasks_;
  std::set<UnitKey> known_units_;
  std::map<UnitKey, RunningTaskInfo> running_tasks_;
  std::map<UnitKey, proto::ExecutionOutcome> results_;
  std::vector<UnitKey> not_run_;
  size_t in_flight_ = 0;
  bool started_ = false;
  bool input_closed_ = false;
  std::string callback_error_;

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> quitting_{false};
  std::vector<std::thread> threads_;
};

// Runs the given units with at most `concurrency` parallel executions (zero
// means one per hardware thread).
std::vector<UnitResult> RunAll(executor::Executor* executor,
                               std::vector<proto::ExecutionUnit> units,
                               const executor::LimitPolicy& policy,
                               int32_t concurrency);

}  // namespace core

#endif
