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

// Utilities for ranking metrics.

#ifndef TSRR_METRIC_RANKING_UTILS_H_
#define TSRR_METRIC_RANKING_UTILS_H_

#include <vector>

namespace tsrr {
namespace metric {

// A candidate of a ranking with its similarity to the query. "relevant" is true
// iff the candidate is the target.
struct ScoredCandidate {
  double similarity;
  bool relevant;
};

inline bool OrderDecreasingSimilarity(const ScoredCandidate& a,
                                      const ScoredCandidate& b) {
  return a.similarity > b.similarity;
}

// The candidates retrieved for one target. "candidates" and "similarities" are
// index-aligned and are not sorted.
template <typename Label>
struct RankingRow {
  Label target;
  std::vector<Label> candidates;
  std::vector<double> similarities;
};

// One row per target. A single target is a batch of size one.
template <typename Label>
using RankingBatch = std::vector<RankingRow<Label>>;

// Relevance of each candidate of "row" i.e. "candidates[i] == target".
template <typename Label>
std::vector<bool> MarkRelevant(const RankingRow<Label>& row) {
  std::vector<bool> relevant(row.candidates.size());
  for (size_t idx = 0; idx < row.candidates.size(); idx++) {
    relevant[idx] = row.candidates[idx] == row.target;
  }
  return relevant;
}

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_RANKING_UTILS_H_
