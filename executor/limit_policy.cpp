#include "executor/limit_policy.hpp"

#include <cmath>

#include "absl/strings/str_cat.h"

namespace executor {

LimitPolicy::LimitPolicy(double timeout_seconds, int64_t max_memory_bytes,
                         int64_t max_output_bytes)
    : timeout_seconds_(timeout_seconds),
      max_memory_bytes_(max_memory_bytes),
      max_output_bytes_(max_output_bytes) {
  if (!(timeout_seconds_ > 0)) {
    throw invalid_limit_policy(
        absl::StrCat("timeout must be positive, got ", timeout_seconds_));
  }
  if (timeout_seconds_ > kMaxTimeoutSeconds) {
    throw invalid_limit_policy(absl::StrCat("timeout must be at most ",
                                            kMaxTimeoutSeconds, "s, got ",
                                            timeout_seconds_));
  }
  if (max_memory_bytes_ <= 0) {
    throw invalid_limit_policy(absl::StrCat(
        "memory limit must be positive, got ", max_memory_bytes_));
  }
  if (max_output_bytes_ < 0) {
    throw invalid_limit_policy(absl::StrCat(
        "output limit must not be negative, got ", max_output_bytes_));
  }
}

int64_t LimitPolicy::WallLimitMillis() const {
  return static_cast<int64_t>(std::ceil(timeout_seconds_ * 1000));
}

int64_t LimitPolicy::CpuLimitMillis() const {
  return (static_cast<int64_t>(std::ceil(timeout_seconds_)) + 1) * 1000;
}

std::string LimitPolicy::DebugString() const {
  return absl::StrCat("timeout=", timeout_seconds_,
                      "s memory=", max_memory_bytes_ / 1024 / 1024,
                      "MiB output=", max_output_bytes_, "B");
}

}  // namespace executor
