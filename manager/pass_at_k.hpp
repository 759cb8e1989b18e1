#ifndef MANAGER_PASS_AT_K_HPP
#define MANAGER_PASS_AT_K_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace manager {

class invalid_k : public std::invalid_argument {
 public:
  explicit invalid_k(const std::string& msg) : std::invalid_argument(msg) {}
};

// Per-problem counts: n samples evaluated, c of them passed.
struct SampleCounts {
  int64_t n;
  int64_t c;
};

// Unbiased estimate of the probability that at least one of k samples drawn
// without replacement from n samples, c of which are correct, is correct:
//   1 - C(n - c, k) / C(n, k)
// computed as a product to avoid overflowing the binomial coefficients.
// Throws invalid_k if k <= 0 or k > n, std::invalid_argument if c is not in
// [0, n].
double PassAtK(int64_t n, int64_t c, int64_t k);

// Mean of PassAtK over problems. Throws invalid_k if any problem has fewer
// than k samples. Returns 0 for an empty batch.
double MeanPassAtK(const std::vector<SampleCounts>& counts, int64_t k);

// Parses a comma separated list of k values such as "1,10,100". The result
// is sorted and without duplicates. Throws invalid_k on malformed or
// non-positive values.
std::vector<int32_t> ParseKs(const std::string& ks);

}  // namespace manager

#endif
