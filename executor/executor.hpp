#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <atomic>
#include <string>

#include "executor/limit_policy.hpp"
#include "proto/evaluation.pb.h"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs a unit under the given limits and returns its outcome. Failures are
  // reported through the outcome kind, never by throwing. When cancelled is
  // set to true the execution is stopped as soon as possible.
  virtual proto::ExecutionOutcome Execute(const proto::ExecutionUnit& unit,
                                          const LimitPolicy& policy,
                                          const std::atomic<bool>* cancelled) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
