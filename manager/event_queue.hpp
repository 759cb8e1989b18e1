#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/evaluation.pb.h"

namespace manager {

// Hands the outcomes produced by the worker threads to a single consumer.
class EventQueue {
 public:
  void Outcome(const proto::ExecutionOutcome& outcome) {
    proto::ExecutionOutcome event = outcome;
    Enqueue(std::move(event));
  }
  // Blocks until an outcome is available. Returns nothing once the queue is
  // stopped and drained.
  absl::optional<proto::ExecutionOutcome> Dequeue();
  // Outcomes enqueued before Stop are still delivered.
  void Stop();
  bool IsStopped() {
    absl::MutexLock lck(&queue_mutex_);
    return stopped_;
  }

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::ExecutionOutcome> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
  void Enqueue(proto::ExecutionOutcome&& event);
};

}  // namespace manager

#endif
