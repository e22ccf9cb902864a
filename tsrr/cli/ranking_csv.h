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

// Loading of rankings stored in CSV files.
//
// The first row is a header. The columns "query", "target", "candidate" and
// "similarity" are required, in any order. Other columns are ignored. Each
// row is one candidate of a query:
//
//   query,target,candidate,similarity
//   q1,cat,dog,0.9
//   q1,cat,cat,0.8
//   q2,car,car,0.7
//
// The rows of a query form one ranking row, and queries are listed in order of
// first appearance. All the rows of a query should have the same target.
// Blank lines are ignored.
//
#ifndef TSRR_CLI_RANKING_CSV_H_
#define TSRR_CLI_RANKING_CSV_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tsrr/metric/ranking_utils.h"

namespace tsrr {
namespace cli {

// Parses the content of a ranking CSV file.
absl::StatusOr<metric::RankingBatch<std::string>> ParseRankingCsv(
    absl::string_view content);

// Reads and parses a ranking CSV file.
absl::StatusOr<metric::RankingBatch<std::string>> LoadRankingCsv(
    absl::string_view path);

}  // namespace cli
}  // namespace tsrr

#endif  // TSRR_CLI_RANKING_CSV_H_
