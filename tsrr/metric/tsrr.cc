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

#include "tsrr/metric/tsrr.h"

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tsrr/metric/expected_rank.h"
#include "tsrr/metric/tie_group.h"
#include "tsrr/metric/tsrr.pb.h"
#include "tsrr/utils/logging.h"
#include "tsrr/utils/math.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace metric {

absl::StatusOr<proto::Reduction> ParseReduction(const absl::string_view name) {
  const std::string lower_name = absl::AsciiStrToLower(name);
  if (lower_name == "mean") {
    return proto::MEAN;
  }
  if (lower_name == "none") {
    return proto::NONE;
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Unknown reduction \"", name, "\". Possible values are \"mean\" and "
      "\"none\"."));
}

absl::StatusOr<double> ComposeScore(const TieGroupStats& stats) {
  if (!stats.found) {
    return 0.;
  }
  ASSIGN_OR_RETURN(const double expected_tie_rank,
                   ExpectedRank(/*offset=*/0., stats.num_irrelevant_in_tie,
                                stats.num_relevant_in_tie));
  const double worst_tie_rank = stats.num_irrelevant_in_tie + 1;
  const double contamination = stats.Contamination();
  const double blended_tie_rank = (1. - contamination) * expected_tie_rank +
                                  contamination * worst_tie_rank;
  return 1. / (stats.rank_before + blended_tie_rank);
}

absl::StatusOr<TsrrValue> ReduceScores(std::vector<double> scores,
                                       const proto::Reduction reduction) {
  switch (reduction) {
    case proto::MEAN:
      if (scores.empty()) {
        return absl::InvalidArgumentError(
            "The mean reduction requires at least one target.");
      }
      return TsrrValue(utils::AccurateMean(scores));
    case proto::NONE:
      return TsrrValue(std::move(scores));
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported reduction ", static_cast<int>(reduction)));
}

TsrrCalculator::TsrrCalculator(const proto::TsrrOptions& options)
    : options_(options) {
  if (options_.has_alpha()) {
    LOG(WARNING) << "The \"alpha\" parameter of the Tie-Sensitive Reciprocal "
                    "Rank is deprecated and ignored (alpha="
                 << options_.alpha() << ").";
  }
}

absl::StatusOr<TsrrCalculator::TargetScore> TsrrCalculator::ScoreTarget(
    const absl::Span<const double> similarities,
    const std::vector<bool>& relevant) const {
  STATUS_CHECK_EQ(similarities.size(), relevant.size());
  TargetScore target_score;
  target_score.stats = ComputeTieGroupStats(similarities, relevant);
  ASSIGN_OR_RETURN(target_score.score, ComposeScore(target_score.stats));
  return target_score;
}

std::vector<double> TsrrCalculator::ExtractScores(
    const absl::Span<const TargetScore> target_scores) {
  std::vector<double> scores;
  scores.reserve(target_scores.size());
  for (const auto& target_score : target_scores) {
    scores.push_back(target_score.score);
  }
  return scores;
}

proto::TsrrEvaluation TsrrCalculator::BuildEvaluation(
    const absl::Span<const TargetScore> target_scores) {
  const std::vector<double> scores = ExtractScores(target_scores);
  proto::TsrrEvaluation evaluation;
  evaluation.set_num_targets(target_scores.size());
  evaluation.mutable_per_target()->Add(scores.begin(), scores.end());
  int64_t num_found = 0;
  int64_t num_tied_with_irrelevant = 0;
  for (const auto& target_score : target_scores) {
    if (target_score.stats.found) {
      num_found++;
      if (target_score.stats.num_irrelevant_in_tie > 0) {
        num_tied_with_irrelevant++;
      }
    }
  }
  evaluation.set_num_found(num_found);
  evaluation.set_num_tied_with_irrelevant(num_tied_with_irrelevant);
  if (!target_scores.empty()) {
    evaluation.set_mean(utils::AccurateMean(scores));
  }
  return evaluation;
}

}  // namespace metric
}  // namespace tsrr
