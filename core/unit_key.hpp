#ifndef CORE_UNIT_KEY_HPP
#define CORE_UNIT_KEY_HPP

#include <string>
#include <tuple>

#include "proto/evaluation.pb.h"

namespace core {

// Identifies an execution unit: at most one outcome exists for each key.
struct UnitKey {
  std::string problem_id;
  int32_t sample_index = 0;

  static UnitKey Of(const proto::ExecutionUnit& unit) {
    return UnitKey{unit.problem_id(), unit.sample_index()};
  }
  static UnitKey Of(const proto::ExecutionOutcome& outcome) {
    return UnitKey{outcome.problem_id(), outcome.sample_index()};
  }

  std::string ToString() const {
    return problem_id + "#" + std::to_string(sample_index);
  }

  bool operator<(const UnitKey& other) const {
    return std::tie(problem_id, sample_index) <
           std::tie(other.problem_id, other.sample_index);
  }
  bool operator==(const UnitKey& other) const {
    return problem_id == other.problem_id &&
           sample_index == other.sample_index;
  }
};

}  // namespace core

#endif
