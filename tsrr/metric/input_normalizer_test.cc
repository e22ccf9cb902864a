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

#include "tsrr/metric/input_normalizer.h"

#include <limits>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "tsrr/metric/ndarray.h"
#include "tsrr/metric/ranking_utils.h"
#include "tsrr/utils/test.h"
#include "tsrr/utils/testing_macros.h"

namespace tsrr {
namespace metric {
namespace {

using test::StatusIs;
using testing::ElementsAre;

using Labels = std::vector<std::string>;
using Similarities = std::vector<double>;

TEST(NormalizeSingle, Base) {
  ASSERT_OK_AND_ASSIGN(
      const auto batch,
      NormalizeSingle<std::string>("a", {"b", "a"}, {0.5, 0.7}));
  ASSERT_EQ(batch.size(), 1);
  EXPECT_EQ(batch[0].target, "a");
  EXPECT_THAT(batch[0].candidates, ElementsAre("b", "a"));
  EXPECT_THAT(batch[0].similarities, ElementsAre(0.5, 0.7));
}

TEST(NormalizeSingle, Empty) {
  ASSERT_OK_AND_ASSIGN(const auto batch,
                       NormalizeSingle<std::string>("a", {}, {}));
  ASSERT_EQ(batch.size(), 1);
  EXPECT_TRUE(batch[0].candidates.empty());
}

TEST(NormalizeSingle, LengthMismatch) {
  EXPECT_THAT(
      NormalizeSingle<std::string>("a", {"b", "a"}, {0.5}).status(),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "For a single target, 'results' and 'similarities' must have "
               "equal lengths. Got 2 results and 1 similarities."));
}

TEST(NormalizeSingle, NonFinite) {
  EXPECT_THAT(NormalizeSingle<std::string>(
                  "a", {"b", "a"},
                  {0.5, std::numeric_limits<double>::quiet_NaN()})
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "at row 0, column 1"));
  EXPECT_THAT(NormalizeSingle<std::string>(
                  "a", {"a"}, {std::numeric_limits<double>::infinity()})
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Non-finite similarity"));
}

TEST(NormalizeBatch, Base) {
  const Labels targets = {"a", "b"};
  const std::vector<Labels> results = {{"a", "x"}, {"y", "b", "z"}};
  const std::vector<Similarities> similarities = {{0.9, 0.8},
                                                  {0.1, 0.2, 0.3}};
  ASSERT_OK_AND_ASSIGN(const auto batch,
                       NormalizeBatch(targets, results, similarities));
  ASSERT_EQ(batch.size(), 2);
  EXPECT_EQ(batch[1].target, "b");
  EXPECT_THAT(batch[1].candidates, ElementsAre("y", "b", "z"));
  EXPECT_THAT(batch[1].similarities, ElementsAre(0.1, 0.2, 0.3));
}

TEST(NormalizeBatch, RowCountMismatch) {
  const Labels targets = {"a", "b"};
  EXPECT_THAT(
      NormalizeBatch(targets, std::vector<Labels>{{"a"}},
                     std::vector<Similarities>{{0.1}, {0.2}})
          .status(),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "the number of rows in 'results' (1) must match the number of "
               "targets (2)"));
  EXPECT_THAT(
      NormalizeBatch(targets, std::vector<Labels>{{"a"}, {"b"}},
                     std::vector<Similarities>{{0.1}, {0.2}, {0.3}})
          .status(),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "the number of rows in 'similarities' (3) must match the "
               "number of targets (2)"));
}

TEST(NormalizeBatch, RowLengthMismatch) {
  const Labels targets = {"a", "b", "c"};
  const std::vector<Labels> results = {{"a"}, {"b", "c"}, {"c"}};
  const std::vector<Similarities> similarities = {{0.1}, {0.2}, {0.3}};
  EXPECT_THAT(NormalizeBatch(targets, results, similarities).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Mismatch in lengths of rows at index 1 between "
                       "'results' (2) and 'similarities' (1)."));
}

TEST(NormalizeBatch, NonFinite) {
  const Labels targets = {"a", "b"};
  const std::vector<Labels> results = {{"a"}, {"b", "c"}};
  const std::vector<Similarities> similarities = {
      {0.1}, {0.2, -std::numeric_limits<double>::infinity()}};
  EXPECT_THAT(NormalizeBatch(targets, results, similarities).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "at row 1, column 1"));
}

TEST(NormalizeArrays, ScalarTarget) {
  ASSERT_OK_AND_ASSIGN(
      const auto batch,
      NormalizeArrays(NdArray<int>::Scalar(2), NdArray<int>::Vector({1, 2}),
                      NdArray<double>::Vector({0.3, 0.4})));
  ASSERT_EQ(batch.size(), 1);
  EXPECT_EQ(batch[0].target, 2);
  EXPECT_THAT(batch[0].candidates, ElementsAre(1, 2));
}

TEST(NormalizeArrays, VectorTarget) {
  ASSERT_OK_AND_ASSIGN(const auto results,
                       NdArray<int>::Create({1, 2, 3, 4}, {2, 2}));
  ASSERT_OK_AND_ASSIGN(const auto similarities,
                       NdArray<double>::Create({0.1, 0.2, 0.3, 0.4}, {2, 2}));
  ASSERT_OK_AND_ASSIGN(
      const auto batch,
      NormalizeArrays(NdArray<int>::Vector({1, 4}), results, similarities));
  ASSERT_EQ(batch.size(), 2);
  EXPECT_EQ(batch[1].target, 4);
  EXPECT_THAT(batch[1].candidates, ElementsAre(3, 4));
  EXPECT_THAT(batch[1].similarities, ElementsAre(0.3, 0.4));
}

TEST(NormalizeArrays, ScalarTargetRequiresVectors) {
  ASSERT_OK_AND_ASSIGN(const auto results,
                       NdArray<int>::Create({1, 2, 3, 4}, {2, 2}));
  EXPECT_THAT(NormalizeArrays(NdArray<int>::Scalar(1), results,
                              NdArray<double>::Vector({0.1, 0.2, 0.3, 0.4}))
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "For a single target, 'results' and 'similarities' "
                       "must be 1-dimensional"));
  EXPECT_THAT(NormalizeArrays(NdArray<int>::Scalar(1),
                              NdArray<int>::Vector({1, 2}),
                              NdArray<double>::Vector({0.1}))
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "must have equal lengths"));
}

TEST(NormalizeArrays, VectorTargetRequiresMatrices) {
  ASSERT_OK_AND_ASSIGN(const auto matrix,
                       NdArray<double>::Create({0.1, 0.2}, {1, 2}));
  EXPECT_THAT(NormalizeArrays(NdArray<int>::Vector({1}),
                              NdArray<int>::Vector({1, 2}), matrix)
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "'results' must be 2-dimensional. Got 1 dimension(s)"));

  ASSERT_OK_AND_ASSIGN(const auto results,
                       NdArray<int>::Create({1, 2}, {1, 2}));
  ASSERT_OK_AND_ASSIGN(const auto cube,
                       NdArray<double>::Create({0.1, 0.2}, {1, 1, 2}));
  EXPECT_THAT(
      NormalizeArrays(NdArray<int>::Vector({1}), results, cube).status(),
      StatusIs(absl::StatusCode::kInvalidArgument,
               "'similarities' must be 2-dimensional. Got 3 dimension(s)"));
}

TEST(NormalizeArrays, VectorTargetRowMismatch) {
  ASSERT_OK_AND_ASSIGN(const auto results,
                       NdArray<int>::Create({1, 2, 3, 4}, {2, 2}));
  ASSERT_OK_AND_ASSIGN(const auto similarities,
                       NdArray<double>::Create({0.1, 0.2, 0.3}, {1, 3}));
  EXPECT_THAT(NormalizeArrays(NdArray<int>::Vector({1, 2, 3}), results,
                              similarities)
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "the number of rows in 'results' (2) must match the "
                       "number of targets (3)"));

  ASSERT_OK_AND_ASSIGN(const auto long_similarities,
                       NdArray<double>::Create({0.1, 0.2, 0.3, 0.4, 0.5, 0.6},
                                               {2, 3}));
  EXPECT_THAT(NormalizeArrays(NdArray<int>::Vector({1, 2}), results,
                              long_similarities)
                  .status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Mismatch in lengths of rows at index 0"));
}

TEST(NormalizeArrays, MatrixTargetIsRejected) {
  ASSERT_OK_AND_ASSIGN(const auto target,
                       NdArray<int>::Create({1, 2}, {1, 2}));
  ASSERT_OK_AND_ASSIGN(const auto results,
                       NdArray<int>::Create({1, 2}, {1, 2}));
  ASSERT_OK_AND_ASSIGN(const auto similarities,
                       NdArray<double>::Create({0.1, 0.2}, {1, 2}));
  EXPECT_THAT(NormalizeArrays(target, results, similarities).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "'target' must be 0-dimensional (single target) or "
                       "1-dimensional (multiple targets). Got 2 dimensions."));
}

TEST(ValidateBatch, Base) {
  RankingBatch<std::string> batch(2);
  batch[0].target = "a";
  batch[0].candidates = {"a"};
  batch[0].similarities = {0.5};
  EXPECT_OK(ValidateBatch(batch));

  batch[1].candidates = {"a", "b"};
  batch[1].similarities = {0.5};
  EXPECT_THAT(ValidateBatch(batch),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Mismatch in lengths of rows at index 1"));

  batch[1].similarities = {0.5, std::numeric_limits<double>::quiet_NaN()};
  EXPECT_THAT(ValidateBatch(batch),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "at row 1, column 1"));
}

TEST(MarkRelevant, Base) {
  RankingRow<std::string> row;
  row.target = "a";
  row.candidates = {"a", "b", "a"};
  EXPECT_THAT(MarkRelevant(row), ElementsAre(true, false, true));
}

}  // namespace
}  // namespace metric
}  // namespace tsrr
