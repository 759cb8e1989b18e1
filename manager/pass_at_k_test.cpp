#include "manager/pass_at_k.hpp"

#include <cmath>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using manager::invalid_k;
using manager::MeanPassAtK;
using manager::ParseKs;
using manager::PassAtK;

// 1 - C(n - c, k) / C(n, k), with exact binomials for small n.
double Combinatorial(int64_t n, int64_t c, int64_t k) {
  auto binomial = [](int64_t a, int64_t b) -> double {
    if (b < 0 || b > a) return 0;
    double result = 1;
    for (int64_t i = 1; i <= b; i++) result = result * (a - b + i) / i;
    return result;
  };
  return 1.0 - binomial(n - c, k) / binomial(n, k);
}

// NOLINTNEXTLINE
TEST(PassAtKTest, MatchesCombinatorialForm) {
  for (int64_t n = 1; n <= 20; n++) {
    for (int64_t c = 0; c <= n; c++) {
      for (int64_t k = 1; k <= n; k++) {
        EXPECT_NEAR(PassAtK(n, c, k), Combinatorial(n, c, k), 1e-9)
            << "n=" << n << " c=" << c << " k=" << k;
      }
    }
  }
}

// NOLINTNEXTLINE
TEST(PassAtKTest, KnownValues) {
  EXPECT_DOUBLE_EQ(PassAtK(10, 6, 1), 0.6);
  // Only 4 failing samples, so any 5 contain a passing one.
  EXPECT_DOUBLE_EQ(PassAtK(10, 6, 5), 1.0);
  EXPECT_DOUBLE_EQ(PassAtK(10, 6, 10), 1.0);
  EXPECT_NEAR(PassAtK(10, 4, 5), 1.0 - 6.0 / 252, 1e-12);
  EXPECT_NEAR(PassAtK(10, 1, 5), 0.5, 1e-12);
}

// NOLINTNEXTLINE
TEST(PassAtKTest, Extremes) {
  EXPECT_DOUBLE_EQ(PassAtK(5, 5, 3), 1.0);
  EXPECT_DOUBLE_EQ(PassAtK(5, 0, 3), 0.0);
  EXPECT_DOUBLE_EQ(PassAtK(1, 1, 1), 1.0);
  EXPECT_DOUBLE_EQ(PassAtK(1, 0, 1), 0.0);
  // n - c < k
  EXPECT_DOUBLE_EQ(PassAtK(10, 8, 3), 1.0);
}

// NOLINTNEXTLINE
TEST(PassAtKTest, LargeN) {
  double value = PassAtK(1000, 1, 1);
  EXPECT_NEAR(value, 0.001, 1e-12);
  value = PassAtK(1000, 500, 100);
  EXPECT_TRUE(std::isfinite(value));
  EXPECT_NEAR(value, 1.0, 1e-12);
}

// NOLINTNEXTLINE
TEST(PassAtKTest, InvalidArguments) {
  EXPECT_THROW(PassAtK(5, 2, 6), invalid_k);               // NOLINT
  EXPECT_THROW(PassAtK(5, 2, 0), invalid_k);               // NOLINT
  EXPECT_THROW(PassAtK(0, 0, 1), invalid_k);               // NOLINT
  EXPECT_THROW(PassAtK(5, 6, 1), std::invalid_argument);   // NOLINT
  EXPECT_THROW(PassAtK(5, -1, 1), std::invalid_argument);  // NOLINT
}

// NOLINTNEXTLINE
TEST(PassAtKTest, Mean) {
  EXPECT_DOUBLE_EQ(MeanPassAtK({{10, 6}, {10, 0}}, 1), 0.3);
  EXPECT_DOUBLE_EQ(MeanPassAtK({{5, 5}, {5, 0}, {5, 5}, {5, 0}}, 3), 0.5);
  EXPECT_DOUBLE_EQ(MeanPassAtK({}, 1), 0.0);
  EXPECT_THROW(MeanPassAtK({{10, 6}, {2, 1}}, 5), invalid_k);  // NOLINT
}

// NOLINTNEXTLINE
TEST(PassAtKTest, ParseKs) {
  EXPECT_THAT(ParseKs("1"), ElementsAre(1));
  EXPECT_THAT(ParseKs("10, 1,100,10"), ElementsAre(1, 10, 100));
  EXPECT_THROW(ParseKs(""), invalid_k);     // NOLINT
  EXPECT_THROW(ParseKs("0"), invalid_k);    // NOLINT
  EXPECT_THROW(ParseKs("1,x"), invalid_k);  // NOLINT
  EXPECT_THROW(ParseKs("-2"), invalid_k);   // NOLINT
}

}  // namespace
