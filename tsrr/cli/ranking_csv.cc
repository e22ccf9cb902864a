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

#include "tsrr/cli/ranking_csv.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tsrr/metric/input_normalizer.h"
#include "tsrr/metric/ranking_utils.h"
#include "tsrr/utils/csv.h"
#include "tsrr/utils/filesystem.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace cli {
namespace {

enum Column { kQuery = 0, kTarget, kCandidate, kSimilarity, kNumColumns };

constexpr std::array<absl::string_view, kNumColumns> kColumnNames = {
    "query", "target", "candidate", "similarity"};

// Index of each required column in the CSV header.
absl::StatusOr<std::array<int, kNumColumns>> GetColumnIndices(
    const std::vector<std::string>& header) {
  std::array<int, kNumColumns> indices;
  for (int column = 0; column < kNumColumns; column++) {
    indices[column] = -1;
    for (int field_idx = 0; field_idx < static_cast<int>(header.size());
         field_idx++) {
      if (header[field_idx] == kColumnNames[column]) {
        indices[column] = field_idx;
        break;
      }
    }
    if (indices[column] == -1) {
      return absl::InvalidArgumentError(
          absl::StrCat("Missing column \"", kColumnNames[column],
                       "\" in the CSV header."));
    }
  }
  return indices;
}

bool IsBlankRow(const std::vector<std::string>& row) {
  return row.size() == 1 && row.front().empty();
}

}  // namespace

absl::StatusOr<metric::RankingBatch<std::string>> ParseRankingCsv(
    const absl::string_view content) {
  utils::csv::Reader reader(content);
  std::vector<std::string> row;
  ASSIGN_OR_RETURN(const bool has_header, reader.NextRow(&row));
  if (!has_header) {
    return absl::InvalidArgumentError("Empty ranking CSV.");
  }
  ASSIGN_OR_RETURN(const auto column_indices, GetColumnIndices(row));
  const int max_column_idx =
      *std::max_element(column_indices.begin(), column_indices.end());

  metric::RankingBatch<std::string> batch;
  // Index in "batch" of each query.
  absl::flat_hash_map<std::string, int> query_to_row_idx;
  while (true) {
    ASSIGN_OR_RETURN(const bool has_row, reader.NextRow(&row));
    if (!has_row) {
      break;
    }
    if (IsBlankRow(row)) {
      continue;
    }
    if (static_cast<int>(row.size()) <= max_column_idx) {
      return absl::InvalidArgumentError(
          absl::StrCat("Line ", reader.num_rows(), " has ", row.size(),
                       " fields. At least ", max_column_idx + 1,
                       " are expected."));
    }
    const std::string& query = row[column_indices[kQuery]];
    const std::string& target = row[column_indices[kTarget]];
    double similarity;
    if (!absl::SimpleAtod(row[column_indices[kSimilarity]], &similarity)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Cannot parse similarity \"", row[column_indices[kSimilarity]],
          "\" at line ", reader.num_rows(), "."));
    }

    const auto it_query =
        query_to_row_idx.try_emplace(query, static_cast<int>(batch.size()));
    if (it_query.second) {
      batch.emplace_back();
      batch.back().target = target;
    }
    auto& ranking_row = batch[it_query.first->second];
    if (ranking_row.target != target) {
      return absl::InvalidArgumentError(absl::StrCat(
          "The query \"", query, "\" has several targets: \"",
          ranking_row.target, "\" and \"", target, "\" (line ",
          reader.num_rows(), ")."));
    }
    ranking_row.candidates.push_back(row[column_indices[kCandidate]]);
    ranking_row.similarities.push_back(similarity);
  }
  RETURN_IF_ERROR(metric::ValidateBatch(batch));
  return batch;
}

absl::StatusOr<metric::RankingBatch<std::string>> LoadRankingCsv(
    const absl::string_view path) {
  ASSIGN_OR_RETURN(const std::string content, file::GetContent(path));
  return ParseRankingCsv(content);
}

}  // namespace cli
}  // namespace tsrr
