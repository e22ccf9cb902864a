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

// Compute the Tie-Sensitive Reciprocal Rank (TsRR) ranking metric.
//
// TsRR scores how well a list of candidates, ranked by decreasing similarity,
// surfaces a target. Unlike the reciprocal rank, the order of candidates with
// the same similarity (a "tie group") is not trusted. For a target whose first
// occurrence is in a tie group with "k" occurrences of the target and "ns"
// other candidates:
//
//   E_L   = Expected rank of the first target in the tie group under random
//           tie-breaking (see "ExpectedRank").
//   L_max = ns + 1, the worst rank of the first target in the tie group.
//   tau   = Fraction of all the non-target candidates that are in the tie
//           group.
//   TsRR  = 1 / (r_pre + (1 - tau) * E_L + tau * L_max)
//
// where "r_pre" is the number of candidates with a strictly higher
// similarity. Without ties, TsRR is the reciprocal rank. A target absent from
// its candidates has a TsRR of 0.
//
// Usage example:
//
//   // Single target.
//   ASSIGN_OR_RETURN(const TsrrValue value,
//                    Tsrr<std::string>("label1", {"label2", "label1"},
//                                      {0.8, 0.9}));
//   std::get<double>(value);  // 1.0
//
//   // Multiple targets, one score per target.
//   proto::TsrrOptions options;
//   options.set_reduction(proto::NONE);
//   ASSIGN_OR_RETURN(const TsrrValue value,
//                    Tsrr(targets, results, similarities, options));
//   std::get<std::vector<double>>(value);
//
#ifndef TSRR_METRIC_TSRR_H_
#define TSRR_METRIC_TSRR_H_

#include <stddef.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tsrr/metric/input_normalizer.h"
#include "tsrr/metric/ndarray.h"
#include "tsrr/metric/ranking_utils.h"
#include "tsrr/metric/tie_group.h"
#include "tsrr/metric/tsrr.pb.h"
#include "tsrr/utils/concurrency.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace metric {

// A single (mean) score, or one score per target.
using TsrrValue = std::variant<double, std::vector<double>>;

// Parses a reduction name: "mean" or "none".
absl::StatusOr<proto::Reduction> ParseReduction(absl::string_view name);

// TsRR of a target from the statistics of its tie group.
absl::StatusOr<double> ComposeScore(const TieGroupStats& stats);

// Aggregates per-target scores. The mean of zero targets is an error.
absl::StatusOr<TsrrValue> ReduceScores(std::vector<double> scores,
                                       proto::Reduction reduction);

class TsrrCalculator {
 public:
  // Score of a target and the statistics it was computed from.
  struct TargetScore {
    double score;
    TieGroupStats stats;
  };

  // Logs a deprecation warning if "options.alpha" is set.
  explicit TsrrCalculator(const proto::TsrrOptions& options);

  // Scores a single target. "relevant[i]" is true iff the i-th candidate is the
  // target.
  absl::StatusOr<TargetScore> ScoreTarget(
      absl::Span<const double> similarities,
      const std::vector<bool>& relevant) const;

  // Scores each row of "batch". The i-th score is the score of the i-th row.
  template <typename Label>
  absl::StatusOr<std::vector<TargetScore>> ScoreTargets(
      const RankingBatch<Label>& batch) const {
    std::vector<TargetScore> scores(batch.size());
    RETURN_IF_ERROR(utils::concurrency::ConcurrentForLoop(
        batch.size(), options_.num_threads(),
        [&](size_t block_idx, size_t begin_idx,
            size_t end_idx) -> absl::Status {
          for (size_t row_idx = begin_idx; row_idx < end_idx; row_idx++) {
            const auto& row = batch[row_idx];
            ASSIGN_OR_RETURN(scores[row_idx],
                             ScoreTarget(row.similarities, MarkRelevant(row)));
          }
          return absl::OkStatus();
        }));
    return scores;
  }

  // Per-target scores of "batch".
  template <typename Label>
  absl::StatusOr<std::vector<double>> ScoreRows(
      const RankingBatch<Label>& batch) const {
    ASSIGN_OR_RETURN(const auto target_scores, ScoreTargets(batch));
    return ExtractScores(target_scores);
  }

  // Scores of "batch" aggregated according to the "reduction" option.
  template <typename Label>
  absl::StatusOr<TsrrValue> Compute(const RankingBatch<Label>& batch) const {
    ASSIGN_OR_RETURN(auto scores, ScoreRows(batch));
    return ReduceScores(std::move(scores), options_.reduction());
  }

  // Evaluation report of "batch". Always contains the per-target scores.
  template <typename Label>
  absl::StatusOr<proto::TsrrEvaluation> Evaluate(
      const RankingBatch<Label>& batch) const {
    ASSIGN_OR_RETURN(const auto target_scores, ScoreTargets(batch));
    return BuildEvaluation(target_scores);
  }

  const proto::TsrrOptions& options() const { return options_; }

 private:
  static std::vector<double> ExtractScores(
      absl::Span<const TargetScore> target_scores);

  static proto::TsrrEvaluation BuildEvaluation(
      absl::Span<const TargetScore> target_scores);

  proto::TsrrOptions options_;
};

// TsRR of a single target.
template <typename Label>
absl::StatusOr<TsrrValue> Tsrr(
    const typename std::vector<Label>::value_type& target,
    const std::vector<Label>& results, const std::vector<double>& similarities,
    const proto::TsrrOptions& options = {}) {
  const TsrrCalculator calculator(options);
  ASSIGN_OR_RETURN(const auto batch,
                   NormalizeSingle<Label>(target, results, similarities));
  return calculator.Compute(batch);
}

// TsRR of multiple targets. "results[i]" and "similarities[i]" are the
// candidates of "targets[i]".
template <typename Label>
absl::StatusOr<TsrrValue> Tsrr(
    const std::vector<Label>& targets,
    const std::vector<std::vector<Label>>& results,
    const std::vector<std::vector<double>>& similarities,
    const proto::TsrrOptions& options = {}) {
  const TsrrCalculator calculator(options);
  ASSIGN_OR_RETURN(const auto batch,
                   NormalizeBatch(targets, results, similarities));
  return calculator.Compute(batch);
}

// TsRR of array-like inputs. See "NormalizeArrays" for the accepted shapes.
template <typename Label>
absl::StatusOr<TsrrValue> Tsrr(const NdArray<Label>& target,
                               const NdArray<Label>& results,
                               const NdArray<double>& similarities,
                               const proto::TsrrOptions& options = {}) {
  const TsrrCalculator calculator(options);
  ASSIGN_OR_RETURN(const auto batch,
                   NormalizeArrays(target, results, similarities));
  return calculator.Compute(batch);
}

// Evaluation report of a batch of rankings. "options.reduction" is ignored:
// the report contains both the mean and the per-target scores.
template <typename Label>
absl::StatusOr<proto::TsrrEvaluation> EvaluateTsrr(
    const RankingBatch<Label>& batch, const proto::TsrrOptions& options = {}) {
  RETURN_IF_ERROR(ValidateBatch(batch));
  return TsrrCalculator(options).Evaluate(batch);
}

// Mean TsRR of multiple targets. Ignores "options.reduction".
template <typename Label>
absl::StatusOr<double> MeanTsrr(
    const std::vector<Label>& targets,
    const std::vector<std::vector<Label>>& results,
    const std::vector<std::vector<double>>& similarities,
    proto::TsrrOptions options = {}) {
  options.set_reduction(proto::MEAN);
  ASSIGN_OR_RETURN(const auto value,
                   Tsrr(targets, results, similarities, options));
  return std::get<double>(value);
}

// TsRR of each target. Ignores "options.reduction".
template <typename Label>
absl::StatusOr<std::vector<double>> TsrrPerTarget(
    const std::vector<Label>& targets,
    const std::vector<std::vector<Label>>& results,
    const std::vector<std::vector<double>>& similarities,
    proto::TsrrOptions options = {}) {
  options.set_reduction(proto::NONE);
  ASSIGN_OR_RETURN(auto value, Tsrr(targets, results, similarities, options));
  return std::get<std::vector<double>>(std::move(value));
}

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_TSRR_H_
