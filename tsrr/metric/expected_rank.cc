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

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tsrr/utils/math.h"

namespace tsrr {
namespace metric {

absl::StatusOr<double> ExpectedRank(const double offset,
                                    const int64_t num_irrelevant,
                                    const int64_t num_relevant) {
  const int64_t num_items = num_irrelevant + num_relevant;
  if (num_irrelevant < 0 || num_relevant <= 0 || num_items <= 0 ||
      num_relevant > num_items) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid tie group composition: ", num_irrelevant,
        " irrelevant and ", num_relevant,
        " relevant items. The tie group should contain at least one relevant "
        "item."));
  }

  // "probability" is P(r) = C(M - r, nt - 1) / C(M, nt), the probability for
  // the first relevant item to be at rank r. The binomial coefficients are
  // not materialized:
  //   P(1) = nt / M
  //   P(r + 1) = P(r) * (M - r - nt + 1) / (M - r)
  // P(r) is zero for r > ns + 1.
  utils::AccurateSum expectation;
  double probability = static_cast<double>(num_relevant) / num_items;
  for (int64_t rank = 1; rank <= num_irrelevant + 1; rank++) {
    expectation.Add(rank * probability);
    if (rank <= num_irrelevant) {
      probability *= static_cast<double>(num_items - rank - num_relevant + 1) /
                     (num_items - rank);
    }
  }
  return offset + expectation.Sum();
}

}  // namespace metric
}  // namespace tsrr
