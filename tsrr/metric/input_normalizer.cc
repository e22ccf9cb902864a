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

#include <stddef.h>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "tsrr/utils/math.h"

namespace tsrr {
namespace metric {
namespace internal {

absl::Status CheckSingleLengths(const size_t num_results,
                                const size_t num_similarities) {
  if (num_results != num_similarities) {
    return absl::InvalidArgumentError(absl::StrCat(
        "For a single target, 'results' and 'similarities' must have equal "
        "lengths. Got ",
        num_results, " results and ", num_similarities, " similarities."));
  }
  return absl::OkStatus();
}

absl::Status CheckSingleDimensions(const size_t results_ndim,
                                   const size_t similarities_ndim) {
  if (results_ndim != 1 || similarities_ndim != 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "For a single target, 'results' and 'similarities' must be "
        "1-dimensional. Got 'results' with ",
        results_ndim, " dimension(s) and 'similarities' with ",
        similarities_ndim, " dimension(s)."));
  }
  return absl::OkStatus();
}

absl::Status CheckBatchDimensions(const size_t results_ndim,
                                  const size_t similarities_ndim) {
  if (results_ndim != 2) {
    return absl::InvalidArgumentError(
        absl::StrCat("For multiple targets, 'results' must be 2-dimensional. "
                     "Got ",
                     results_ndim, " dimension(s)."));
  }
  if (similarities_ndim != 2) {
    return absl::InvalidArgumentError(
        absl::StrCat("For multiple targets, 'similarities' must be "
                     "2-dimensional. Got ",
                     similarities_ndim, " dimension(s)."));
  }
  return absl::OkStatus();
}

absl::Status CheckBatchRowCounts(const size_t num_targets,
                                 const size_t num_result_rows,
                                 const size_t num_similarity_rows) {
  if (num_result_rows != num_targets) {
    return absl::InvalidArgumentError(absl::StrCat(
        "For multiple targets, the number of rows in 'results' (",
        num_result_rows, ") must match the number of targets (", num_targets,
        ")."));
  }
  if (num_similarity_rows != num_targets) {
    return absl::InvalidArgumentError(absl::StrCat(
        "For multiple targets, the number of rows in 'similarities' (",
        num_similarity_rows, ") must match the number of targets (",
        num_targets, ")."));
  }
  return absl::OkStatus();
}

absl::Status CheckRowLengths(const size_t row_idx, const size_t num_results,
                             const size_t num_similarities) {
  if (num_results != num_similarities) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Mismatch in lengths of rows at index ", row_idx,
        " between 'results' (", num_results, ") and 'similarities' (",
        num_similarities, ")."));
  }
  return absl::OkStatus();
}

absl::Status CheckFiniteSimilarities(
    const size_t row_idx, const absl::Span<const double> similarities) {
  int column_idx;
  if (!utils::AllFinite(similarities, &column_idx)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Non-finite similarity ", similarities[column_idx], " at row ",
        row_idx, ", column ", column_idx,
        ". Similarities must be finite numbers."));
  }
  return absl::OkStatus();
}

absl::Status InvalidTargetDimensions(const size_t target_ndim) {
  return absl::InvalidArgumentError(absl::StrCat(
      "'target' must be 0-dimensional (single target) or 1-dimensional "
      "(multiple targets). Got ",
      target_ndim, " dimensions."));
}

}  // namespace internal
}  // namespace metric
}  // namespace tsrr
