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

#include "tsrr/utils/math.h"

#include <cmath>
#include <limits>
#include <vector>

#include "gtest/gtest.h"

namespace tsrr {
namespace utils {
namespace {

TEST(AccurateSum, Base) {
  AccurateSum sum;
  EXPECT_EQ(sum.Sum(), 0.);
  sum.Add(1.);
  sum.Add(2.5);
  EXPECT_EQ(sum.Sum(), 3.5);
}

TEST(AccurateSum, ManySmallTerms) {
  AccurateSum accurate;
  double naive = 1.;
  accurate.Add(1.);
  for (int i = 0; i < 10000000; i++) {
    accurate.Add(1e-16);
    naive += 1e-16;
  }
  // Each "1e-16" is below the precision of 1.0 and is lost by a naive sum.
  EXPECT_EQ(naive, 1.);
  EXPECT_NEAR(accurate.Sum(), 1. + 1e-9, 1e-12);
}

TEST(AccurateMean, Empty) { EXPECT_TRUE(std::isnan(AccurateMean({}))); }

TEST(AccurateMean, Base) {
  EXPECT_EQ(AccurateMean({2.}), 2.);
  EXPECT_EQ(AccurateMean({1., 0.5, 0.}), 0.5);
  EXPECT_NEAR(AccurateMean({1., 1. / 3, 1. / 3}), 5. / 9, 1e-12);
}

TEST(AllFinite, Base) {
  int first = -1;
  EXPECT_TRUE(AllFinite({}, &first));
  EXPECT_TRUE(AllFinite({0., -1., 1e300}, &first));
  EXPECT_EQ(first, -1);

  EXPECT_FALSE(AllFinite({0.5, std::numeric_limits<double>::quiet_NaN()},
                         &first));
  EXPECT_EQ(first, 1);

  EXPECT_FALSE(AllFinite({std::numeric_limits<double>::infinity(), 0.},
                         &first));
  EXPECT_EQ(first, 0);

  EXPECT_FALSE(AllFinite({1., -std::numeric_limits<double>::infinity()},
                         nullptr));
}

}  // namespace
}  // namespace utils
}  // namespace tsrr
