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

#include "absl/types/span.h"

namespace tsrr {
namespace utils {

double AccurateMean(const absl::Span<const double> values) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  AccurateSum sum;
  for (const double value : values) {
    sum.Add(value);
  }
  return sum.Sum() / values.size();
}

bool AllFinite(const absl::Span<const double> values, int* first_non_finite) {
  for (int idx = 0; idx < values.size(); idx++) {
    if (!std::isfinite(values[idx])) {
      if (first_non_finite) {
        *first_non_finite = idx;
      }
      return false;
    }
  }
  return true;
}

}  // namespace utils
}  // namespace tsrr
