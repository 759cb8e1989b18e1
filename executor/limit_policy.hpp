#ifndef EXECUTOR_LIMIT_POLICY_HPP
#define EXECUTOR_LIMIT_POLICY_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace executor {

class invalid_limit_policy : public std::invalid_argument {
 public:
  explicit invalid_limit_policy(const std::string& msg)
      : std::invalid_argument(msg) {}
};

// Resource ceilings applied to every execution. Immutable once built, so a
// single instance can be shared by all the workers.
class LimitPolicy {
 public:
  static const constexpr double kDefaultTimeoutSeconds = 3.0;
  static const constexpr int64_t kDefaultMaxMemoryBytes = 1LL << 30;
  static const constexpr int64_t kDefaultMaxOutputBytes = 64 * 1024;
  static const constexpr double kMaxTimeoutSeconds = 24 * 3600;

  // Throws invalid_limit_policy if timeout_seconds or max_memory_bytes are
  // not positive, if timeout_seconds exceeds kMaxTimeoutSeconds, or if
  // max_output_bytes is negative.
  LimitPolicy(double timeout_seconds = kDefaultTimeoutSeconds,
              int64_t max_memory_bytes = kDefaultMaxMemoryBytes,
              int64_t max_output_bytes = kDefaultMaxOutputBytes);

  double timeout_seconds() const { return timeout_seconds_; }
  int64_t max_memory_bytes() const { return max_memory_bytes_; }
  int64_t max_output_bytes() const { return max_output_bytes_; }

  // Wall clock limit, rounded up to the next millisecond.
  int64_t WallLimitMillis() const;
  // CPU time limit: the timeout rounded up to whole seconds, plus one second
  // of slack so that the wall clock limit normally triggers first.
  int64_t CpuLimitMillis() const;
  // Memory limit rounded up to the next KiB, never 0.
  int64_t MemoryLimitKb() const {
    return max_memory_bytes_ / 1024 + (max_memory_bytes_ % 1024 != 0);
  }

  std::string DebugString() const;

 private:
  double timeout_seconds_;
  int64_t max_memory_bytes_;
  int64_t max_output_bytes_;
};

}  // namespace executor

#endif
