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

// Conversion of the accepted input shapes into a "RankingBatch".
//
// Three input forms are accepted:
//   - A single target with a list of candidates and a list of similarities
//     ("NormalizeSingle").
//   - A list of targets with one list of candidates and one list of
//     similarities per target ("NormalizeBatch").
//   - Array-like inputs whose dimensionality is only known at runtime
//     ("NormalizeArrays"). A 0-dimensional target is a single target, a
//     1-dimensional target is a list of targets.
//
// All the forms produce the same "RankingBatch", and the scoring only operates
// on this representation. Invalid inputs are rejected with an
// "InvalidArgument" status; inputs are never truncated or padded.
//
#ifndef TSRR_METRIC_INPUT_NORMALIZER_H_
#define TSRR_METRIC_INPUT_NORMALIZER_H_

#include <stddef.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "tsrr/metric/ndarray.h"
#include "tsrr/metric/ranking_utils.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace metric {
namespace internal {

// Checks that the candidates and similarities of a single target have the
// same length.
absl::Status CheckSingleLengths(size_t num_results, size_t num_similarities);

// Checks that "results" and "similarities" of a single target are
// 1-dimensional.
absl::Status CheckSingleDimensions(size_t results_ndim,
                                   size_t similarities_ndim);

// Checks that "results" and "similarities" of multiple targets are
// 2-dimensional.
absl::Status CheckBatchDimensions(size_t results_ndim,
                                  size_t similarities_ndim);

// Checks that there is one row of candidates and one row of similarities for
// each target.
absl::Status CheckBatchRowCounts(size_t num_targets, size_t num_result_rows,
                                 size_t num_similarity_rows);

// Checks that the "row_idx"-th rows of candidates and similarities have the
// same length.
absl::Status CheckRowLengths(size_t row_idx, size_t num_results,
                             size_t num_similarities);

// Checks that all the similarities of a row are finite.
absl::Status CheckFiniteSimilarities(size_t row_idx,
                                     absl::Span<const double> similarities);

// Error returned when "target" is neither 0 nor 1-dimensional.
absl::Status InvalidTargetDimensions(size_t target_ndim);

}  // namespace internal

// Checks a batch built without the "Normalize*" functions.
template <typename Label>
absl::Status ValidateBatch(const RankingBatch<Label>& batch) {
  for (size_t row_idx = 0; row_idx < batch.size(); row_idx++) {
    const auto& row = batch[row_idx];
    RETURN_IF_ERROR(internal::CheckRowLengths(row_idx, row.candidates.size(),
                                              row.similarities.size()));
    RETURN_IF_ERROR(
        internal::CheckFiniteSimilarities(row_idx, row.similarities));
  }
  return absl::OkStatus();
}

// Normalizes a single target and its candidates. "Label" is deduced from
// "results" only so that e.g. a string literal target can be matched against
// "std::string" candidates.
template <typename Label>
absl::StatusOr<RankingBatch<Label>> NormalizeSingle(
    const typename std::vector<Label>::value_type& target,
    const std::vector<Label>& results,
    const std::vector<double>& similarities) {
  RETURN_IF_ERROR(
      internal::CheckSingleLengths(results.size(), similarities.size()));
  RETURN_IF_ERROR(internal::CheckFiniteSimilarities(0, similarities));
  RankingBatch<Label> batch(1);
  batch.front().target = target;
  batch.front().candidates = results;
  batch.front().similarities = similarities;
  return batch;
}

// Normalizes a list of targets. "results[i]" and "similarities[i]" are the
// candidates and similarities of "targets[i]".
template <typename Label>
absl::StatusOr<RankingBatch<Label>> NormalizeBatch(
    const std::vector<Label>& targets,
    const std::vector<std::vector<Label>>& results,
    const std::vector<std::vector<double>>& similarities) {
  RETURN_IF_ERROR(internal::CheckBatchRowCounts(
      targets.size(), results.size(), similarities.size()));
  RankingBatch<Label> batch(targets.size());
  for (size_t row_idx = 0; row_idx < targets.size(); row_idx++) {
    RETURN_IF_ERROR(internal::CheckRowLengths(
        row_idx, results[row_idx].size(), similarities[row_idx].size()));
    RETURN_IF_ERROR(
        internal::CheckFiniteSimilarities(row_idx, similarities[row_idx]));
    auto& row = batch[row_idx];
    row.target = targets[row_idx];
    row.candidates = results[row_idx];
    row.similarities = similarities[row_idx];
  }
  return batch;
}

// Normalizes array-like inputs. The form is selected by the dimensionality of
// "target":
//   0: Single target. "results" and "similarities" should be 1-dimensional.
//   1: Multiple targets. "results" and "similarities" should be
//      2-dimensional with one row per target.
template <typename Label>
absl::StatusOr<RankingBatch<Label>> NormalizeArrays(
    const NdArray<Label>& target, const NdArray<Label>& results,
    const NdArray<double>& similarities) {
  switch (target.ndim()) {
    case 0: {
      RETURN_IF_ERROR(internal::CheckSingleDimensions(results.ndim(),
                                                      similarities.ndim()));
      const auto result_values = results.values();
      const auto similarity_values = similarities.values();
      return NormalizeSingle<Label>(
          target.ScalarValue(),
          std::vector<Label>(result_values.begin(), result_values.end()),
          std::vector<double>(similarity_values.begin(),
                              similarity_values.end()));
    }
    case 1: {
      RETURN_IF_ERROR(internal::CheckBatchDimensions(results.ndim(),
                                                     similarities.ndim()));
      const size_t num_targets = target.shape()[0];
      RETURN_IF_ERROR(internal::CheckBatchRowCounts(
          num_targets, results.shape()[0], similarities.shape()[0]));
      RankingBatch<Label> batch(num_targets);
      for (size_t row_idx = 0; row_idx < num_targets; row_idx++) {
        const auto result_row = results.Row(row_idx);
        const auto similarity_row = similarities.Row(row_idx);
        RETURN_IF_ERROR(internal::CheckRowLengths(row_idx, result_row.size(),
                                                  similarity_row.size()));
        RETURN_IF_ERROR(
            internal::CheckFiniteSimilarities(row_idx, similarity_row));
        auto& row = batch[row_idx];
        row.target = target.values()[row_idx];
        row.candidates.assign(result_row.begin(), result_row.end());
        row.similarities.assign(similarity_row.begin(), similarity_row.end());
      }
      return batch;
    }
    default:
      return internal::InvalidTargetDimensions(target.ndim());
  }
}

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_INPUT_NORMALIZER_H_
