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

// Expected rank of the first relevant item under random tie-breaking.

#ifndef TSRR_METRIC_EXPECTED_RANK_H_
#define TSRR_METRIC_EXPECTED_RANK_H_

#include <stdint.h>

#include "absl/status/statusor.h"

namespace tsrr {
namespace metric {

// Given "num_irrelevant" (ns) and "num_relevant" (nt) items ordered by a
// uniformly random permutation, returns "offset" plus the expected 1-based
// rank of the first relevant item:
//
//   offset + sum_{r=1}^{M} r * C(M - r, nt - 1) / C(M, nt),  with M = ns + nt.
//
// The value is a closed-form expectation; no sampling is involved.
//
// Returns an "InvalidArgument" error if "num_irrelevant < 0" or
// "num_relevant <= 0".
absl::StatusOr<double> ExpectedRank(double offset, int64_t num_irrelevant,
                                    int64_t num_relevant);

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_EXPECTED_RANK_H_
