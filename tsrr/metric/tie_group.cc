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

#include "tsrr/metric/tie_group.h"

#include <algorithm>
#include <vector>

#include "absl/types/span.h"
#include "tsrr/metric/ranking_utils.h"
#include "tsrr/utils/logging.h"

namespace tsrr {
namespace metric {

double TieGroupStats::Contamination() const {
  const int64_t irrelevant = num_irrelevant();
  if (irrelevant <= 0) {
    return 0.;
  }
  return static_cast<double>(num_irrelevant_in_tie) / irrelevant;
}

TieGroupStats ComputeTieGroupStats(const absl::Span<const double> similarities,
                                   const std::vector<bool>& relevant) {
  DCHECK_EQ(similarities.size(), relevant.size());

  std::vector<ScoredCandidate> sorted_candidates;
  sorted_candidates.reserve(similarities.size());
  for (size_t idx = 0; idx < similarities.size(); idx++) {
    sorted_candidates.push_back({similarities[idx], relevant[idx]});
  }
  std::sort(sorted_candidates.begin(), sorted_candidates.end(),
            OrderDecreasingSimilarity);

  TieGroupStats stats;
  stats.num_candidates = sorted_candidates.size();
  stats.num_relevant =
      std::count(relevant.begin(), relevant.end(), true);

  const auto first_relevant =
      std::find_if(sorted_candidates.begin(), sorted_candidates.end(),
                   [](const ScoredCandidate& c) { return c.relevant; });
  if (first_relevant == sorted_candidates.end()) {
    return stats;
  }
  stats.found = true;

  const double tie_similarity = first_relevant->similarity;
  for (const auto& candidate : sorted_candidates) {
    if (candidate.similarity > tie_similarity) {
      stats.rank_before++;
    } else if (candidate.similarity == tie_similarity) {
      if (candidate.relevant) {
        stats.num_relevant_in_tie++;
      } else {
        stats.num_irrelevant_in_tie++;
      }
    } else {
      break;
    }
  }
  DCHECK_GE(stats.num_relevant_in_tie, 1);
  return stats;
}

}  // namespace metric
}  // namespace tsrr
