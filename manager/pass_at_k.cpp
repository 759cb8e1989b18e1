#include "manager/pass_at_k.hpp"

#include <algorithm>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace manager {

double PassAtK(int64_t n, int64_t c, int64_t k) {
  if (k <= 0) throw invalid_k(absl::StrCat("k must be positive, got ", k));
  if (k > n) {
    throw invalid_k(absl::StrCat("k = ", k, " exceeds the ", n,
                                 " available samples"));
  }
  if (c < 0 || c > n) {
    throw std::invalid_argument(
        absl::StrCat("correct samples ", c, " not in [0, ", n, "]"));
  }
  if (n - c < k) return 1.0;
  double prob_all_wrong = 1.0;
  for (int64_t i = n - c + 1; i <= n; i++) {
    prob_all_wrong *= 1.0 - static_cast<double>(k) / i;
  }
  return 1.0 - prob_all_wrong;
}

double MeanPassAtK(const std::vector<SampleCounts>& counts, int64_t k) {
  if (counts.empty()) return 0;
  double sum = 0;
  for (const SampleCounts& problem : counts) {
    sum += PassAtK(problem.n, problem.c, k);
  }
  return sum / counts.size();
}

std::vector<int32_t> ParseKs(const std::string& ks) {
  std::vector<int32_t> result;
  for (absl::string_view part : absl::StrSplit(ks, ',', absl::SkipEmpty())) {
    int32_t k = 0;
    if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(part), &k)) {
      throw invalid_k(absl::StrCat("invalid k \"", part, "\""));
    }
    if (k <= 0) throw invalid_k(absl::StrCat("k must be positive, got ", k));
    result.push_back(k);
  }
  if (result.empty()) throw invalid_k("no k requested");
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

}  // namespace manager
