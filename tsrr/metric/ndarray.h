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

// Dense row-major array with a shape only known at runtime.
//
// "NdArray" is the representation of array-like inputs whose dimensionality
// is decided by the caller, for instance a single target (0-dimensional) or a
// batch of targets (1-dimensional).
//
// Usage example:
//   const auto target = NdArray<std::string>::Scalar("a");
//   ASSIGN_OR_RETURN(const auto similarities,
//                    NdArray<double>::Create({0.9, 0.8, 0.7, 0.6}, {2, 2}));
//   similarities.Row(1);  // {0.7, 0.6}
//
#ifndef TSRR_METRIC_NDARRAY_H_
#define TSRR_METRIC_NDARRAY_H_

#include <stddef.h>

#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "tsrr/utils/logging.h"

namespace tsrr {
namespace metric {

template <typename T>
class NdArray {
 public:
  // 0-dimensional array containing a single value.
  static NdArray Scalar(T value) {
    std::vector<T> values;
    values.push_back(std::move(value));
    return NdArray(std::move(values), {});
  }

  // 1-dimensional array.
  static NdArray Vector(std::vector<T> values) {
    const size_t size = values.size();
    return NdArray(std::move(values), {size});
  }

  // Array of any shape. "values" are stored in row-major order and their
  // number should match the product of the dimensions.
  static absl::StatusOr<NdArray> Create(std::vector<T> values,
                                        std::vector<size_t> shape) {
    size_t expected_size = 1;
    for (const size_t dim : shape) {
      expected_size *= dim;
    }
    if (expected_size != values.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("An array of shape [", absl::StrJoin(shape, ","),
                       "] requires ", expected_size, " values. ",
                       values.size(), " values were given."));
    }
    return NdArray(std::move(values), std::move(shape));
  }

  // Number of dimensions.
  size_t ndim() const { return shape_.size(); }

  const std::vector<size_t>& shape() const { return shape_; }

  // Total number of values.
  size_t size() const { return values_.size(); }

  absl::Span<const T> values() const { return values_; }

  // Value of a 0-dimensional array.
  const T& ScalarValue() const {
    DCHECK_EQ(ndim(), 0);
    return values_.front();
  }

  // "row_idx"-th row of a 2-dimensional array.
  absl::Span<const T> Row(const size_t row_idx) const {
    DCHECK_EQ(ndim(), 2);
    DCHECK_LT(row_idx, shape_[0]);
    return absl::MakeConstSpan(values_).subspan(row_idx * shape_[1],
                                                shape_[1]);
  }

 private:
  NdArray(std::vector<T> values, std::vector<size_t> shape)
      : values_(std::move(values)), shape_(std::move(shape)) {}

  std::vector<T> values_;
  std::vector<size_t> shape_;
};

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_NDARRAY_H_
