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

// Location of the target in a ranking with ties.
//
// The candidates are sorted by decreasing similarity. The "tie group" of the
// target is the set of candidates sharing the similarity of the first relevant
// candidate. Similarities are compared with exact equality. Only aggregated
// counts over the tie group are computed, so the result does not depend on how
// the sort orders candidates with equal similarities.
//
#ifndef TSRR_METRIC_TIE_GROUP_H_
#define TSRR_METRIC_TIE_GROUP_H_

#include <stdint.h>

#include <vector>

#include "absl/types/span.h"

namespace tsrr {
namespace metric {

struct TieGroupStats {
  // True iff at least one candidate is relevant. If false, all the other
  // fields are zero except for "num_candidates".
  bool found = false;

  // Number of candidates with a similarity strictly greater than the tie group
  // i.e. "r_pre".
  int64_t rank_before = 0;

  // Number of relevant (k) and irrelevant (ns) candidates in the tie group.
  int64_t num_relevant_in_tie = 0;
  int64_t num_irrelevant_in_tie = 0;

  // Number of candidates (N) and relevant candidates (R_total) in the row.
  int64_t num_candidates = 0;
  int64_t num_relevant = 0;

  int64_t num_irrelevant() const { return num_candidates - num_relevant; }

  int64_t tie_group_size() const {
    return num_relevant_in_tie + num_irrelevant_in_tie;
  }

  // Fraction of the irrelevant candidates of the row that are in the tie
  // group (tau). Zero if the row has no irrelevant candidates.
  double Contamination() const;
};

// Computes the tie group statistics of a row. "similarities[i]" and
// "relevant[i]" describe the i-th candidate, in any order.
TieGroupStats ComputeTieGroupStats(absl::Span<const double> similarities,
                                   const std::vector<bool>& relevant);

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_TIE_GROUP_H_
