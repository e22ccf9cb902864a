/*
 * Copyright 2022 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "tsrr/metric/expected_rank.h"

#include <stdint.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "tsrr/utils/test.h"
#include "tsrr/utils/testing_macros.h"

namespace tsrr {
namespace metric {
namespace {

using test::StatusIs;

// Expected rank computed with explicit binomial coefficients.
double ExpectedRankWithBinomials(const int num_irrelevant,
                                 const int num_relevant) {
  const auto binomial = [](int n, int k) -> double {
    if (k < 0 || k > n) {
      return 0.;
    }
    double value = 1.;
    for (int i = 1; i <= k; i++) {
      value = value * (n - k + i) / i;
    }
    return value;
  };
  const int num_items = num_irrelevant + num_relevant;
  double expectation = 0.;
  for (int rank = 1; rank <= num_items; rank++) {
    expectation += rank * binomial(num_items - rank, num_relevant - 1) /
                   binomial(num_items, num_relevant);
  }
  return expectation;
}

TEST(ExpectedRank, NoIrrelevant) {
  for (int num_relevant = 1; num_relevant < 5; num_relevant++) {
    ASSERT_OK_AND_ASSIGN(const double rank, ExpectedRank(0., 0, num_relevant));
    EXPECT_DOUBLE_EQ(rank, 1.);
  }
}

TEST(ExpectedRank, Base) {
  double rank;
  ASSERT_OK_AND_ASSIGN(rank, ExpectedRank(0., 1, 1));
  EXPECT_DOUBLE_EQ(rank, 1.5);

  ASSERT_OK_AND_ASSIGN(rank, ExpectedRank(0., 3, 1));
  EXPECT_DOUBLE_EQ(rank, 2.5);

  // 1 * 2/3 + 2 * 1/3
  ASSERT_OK_AND_ASSIGN(rank, ExpectedRank(0., 1, 2));
  EXPECT_NEAR(rank, 4. / 3., 1e-12);
}

TEST(ExpectedRank, Offset) {
  ASSERT_OK_AND_ASSIGN(const double rank, ExpectedRank(10., 1, 1));
  EXPECT_DOUBLE_EQ(rank, 11.5);
}

TEST(ExpectedRank, MatchesBinomialSum) {
  for (int num_irrelevant = 0; num_irrelevant < 20; num_irrelevant++) {
    for (int num_relevant = 1; num_relevant < 10; num_relevant++) {
      ASSERT_OK_AND_ASSIGN(const double rank,
                           ExpectedRank(0., num_irrelevant, num_relevant));
      EXPECT_NEAR(rank, ExpectedRankWithBinomials(num_irrelevant, num_relevant),
                  1e-9)
          << "num_irrelevant=" << num_irrelevant
          << " num_relevant=" << num_relevant;
    }
  }
}

TEST(ExpectedRank, MatchesClosedForm) {
  // E = (M + 1) / (nt + 1).
  for (const int64_t num_irrelevant : {0, 1, 7, 100, 10000, 1000000}) {
    for (const int64_t num_relevant : {1, 2, 5, 1000}) {
      ASSERT_OK_AND_ASSIGN(const double rank,
                           ExpectedRank(0., num_irrelevant, num_relevant));
      const double expected_rank =
          static_cast<double>(num_irrelevant + num_relevant + 1) /
          (num_relevant + 1);
      EXPECT_NEAR(rank, expected_rank, 1e-9 * expected_rank)
          << "num_irrelevant=" << num_irrelevant
          << " num_relevant=" << num_relevant;
    }
  }
}

TEST(ExpectedRank, MonotonicInNumIrrelevant) {
  for (const int64_t num_relevant : {1, 2, 3, 10}) {
    double last_rank = 0.;
    for (int64_t num_irrelevant = 0; num_irrelevant < 200; num_irrelevant++) {
      ASSERT_OK_AND_ASSIGN(const double rank,
                           ExpectedRank(0., num_irrelevant, num_relevant));
      EXPECT_GE(rank, last_rank);
      // The first relevant item is at worst after all the irrelevant items.
      EXPECT_GE(rank, 1.);
      EXPECT_LE(rank, num_irrelevant + 1.);
      last_rank = rank;
    }
  }
}

TEST(ExpectedRank, InvalidComposition) {
  EXPECT_THAT(ExpectedRank(0., 0, 0).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Invalid tie group composition"));
  EXPECT_THAT(ExpectedRank(0., 3, 0).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ExpectedRank(0., -1, 2).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ExpectedRank(0., 2, -1).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace metric
}  // namespace tsrr
