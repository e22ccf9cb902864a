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

// Mathematical operations.

#ifndef TSRR_UTILS_MATH_H_
#define TSRR_UTILS_MATH_H_

#include <cmath>

#include "absl/types/span.h"

namespace tsrr {
namespace utils {

// Kahan summation. Sums of many small terms (e.g. reciprocal ranks) keep
// their precision regardless of the number of terms.
class AccurateSum {
 public:
  AccurateSum() {}

  void Add(const double value) {
    error_sum_ += value;
    const auto new_sum = sum_ + error_sum_;
    error_sum_ += sum_ - new_sum;
    sum_ = new_sum;
  }

  double Sum() const { return sum_; }

 private:
  double sum_ = 0.;
  double error_sum_ = 0.;
};

// Arithmetic mean of "values" computed with an "AccurateSum". Returns NaN if
// "values" is empty.
double AccurateMean(absl::Span<const double> values);

// Tests if all the values are finite i.e. neither NaN nor +/-Inf. If not,
// "first_non_finite" is set to the index of the first offending value.
bool AllFinite(absl::Span<const double> values, int* first_non_finite);

}  // namespace utils
}  // namespace tsrr

#endif  // TSRR_UTILS_MATH_H_
