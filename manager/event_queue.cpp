#include "manager/event_queue.hpp"

#include <stdexcept>

namespace manager {

void EventQueue::Enqueue(proto::ExecutionOutcome&& event) {
  absl::MutexLock lck(&queue_mutex_);
  if (stopped_) throw std::logic_error("Outcome enqueued after Stop");
  queue_.push(std::move(event));
}

absl::optional<proto::ExecutionOutcome> EventQueue::Dequeue() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  if (queue_.empty()) return {};
  absl::optional<proto::ExecutionOutcome> event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}
}  // namespace manager
