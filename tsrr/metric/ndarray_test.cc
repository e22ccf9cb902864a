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

#include "tsrr/metric/ndarray.h"

#include <string>
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
using testing::ElementsAre;

TEST(NdArray, Scalar) {
  const auto array = NdArray<std::string>::Scalar("a");
  EXPECT_EQ(array.ndim(), 0);
  EXPECT_EQ(array.size(), 1);
  EXPECT_EQ(array.ScalarValue(), "a");
}

TEST(NdArray, Vector) {
  const auto array = NdArray<int>::Vector({1, 2, 3});
  EXPECT_EQ(array.ndim(), 1);
  EXPECT_THAT(array.shape(), ElementsAre(3));
  EXPECT_THAT(array.values(), ElementsAre(1, 2, 3));
}

TEST(NdArray, Matrix) {
  ASSERT_OK_AND_ASSIGN(const auto array,
                       NdArray<double>::Create({1, 2, 3, 4, 5, 6}, {2, 3}));
  EXPECT_EQ(array.ndim(), 2);
  EXPECT_THAT(array.shape(), ElementsAre(2, 3));
  EXPECT_THAT(array.Row(0), ElementsAre(1, 2, 3));
  EXPECT_THAT(array.Row(1), ElementsAre(4, 5, 6));
}

TEST(NdArray, EmptyRows) {
  ASSERT_OK_AND_ASSIGN(const auto array, NdArray<double>::Create({}, {2, 0}));
  EXPECT_EQ(array.size(), 0);
  EXPECT_TRUE(array.Row(1).empty());
}

TEST(NdArray, ShapeMismatch) {
  EXPECT_THAT(NdArray<double>::Create({1, 2, 3}, {2, 2}).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "An array of shape [2,2] requires 4 values"));
}

}  // namespace
}  // namespace metric
}  // namespace tsrr
