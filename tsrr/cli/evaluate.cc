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

// Computes the Tie-Sensitive Reciprocal Rank of rankings stored in a CSV file.
//
// See "ranking_csv.h" for the format of the CSV file.
//
// Usage example:
//   evaluate \
//     --alsologtostderr \
//     --input=/path/to/rankings.csv \
//     --reduction=none
//
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "tsrr/cli/ranking_csv.h"
#include "tsrr/metric/report.h"
#include "tsrr/metric/tsrr.h"
#include "tsrr/metric/tsrr.pb.h"
#include "tsrr/utils/logging.h"
#include "tsrr/utils/protobuf.h"
#include "tsrr/utils/status_macros.h"

ABSL_FLAG(std::string, input, "",
          "Path to a CSV file with the columns \"query\", \"target\", "
          "\"candidate\" and \"similarity\".");

ABSL_FLAG(std::string, options, "",
          "Optional evaluation configuration. proto::TsrrOptions text proto. "
          "The other flags take precedence.");

ABSL_FLAG(std::string, reduction, "",
          "Aggregation of the scores: \"mean\" or \"none\". If \"none\", the "
          "score of each query is printed.");

ABSL_FLAG(int, num_threads, -1,
          "Number of threads used to score the queries. If -1, uses the "
          "value of --options.");

ABSL_FLAG(double, alpha, -1,
          "Deprecated and ignored. Only used for compatibility with former "
          "command lines.");

ABSL_FLAG(bool, text_proto, false,
          "If true, prints the evaluation as a proto::TsrrEvaluation text "
          "proto instead of a human readable report.");

constexpr char kUsageMessage[] =
    "Computes the Tie-Sensitive Reciprocal Rank of rankings stored in a CSV "
    "file.";

namespace tsrr {
namespace cli {

absl::Status Evaluate() {
  if (absl::GetFlag(FLAGS_input).empty()) {
    return absl::InvalidArgumentError("The --input flag is required.");
  }

  ASSIGN_OR_RETURN(
      auto options,
      utils::ParseTextProto<metric::proto::TsrrOptions>(
          absl::GetFlag(FLAGS_options)),
      _ << "Cannot parse --options");
  if (!absl::GetFlag(FLAGS_reduction).empty()) {
    ASSIGN_OR_RETURN(const auto reduction,
                     metric::ParseReduction(absl::GetFlag(FLAGS_reduction)));
    options.set_reduction(reduction);
  }
  if (absl::GetFlag(FLAGS_num_threads) != -1) {
    options.set_num_threads(absl::GetFlag(FLAGS_num_threads));
  }
  if (absl::GetFlag(FLAGS_alpha) != -1) {
    options.set_alpha(absl::GetFlag(FLAGS_alpha));
  }

  ASSIGN_OR_RETURN(const auto batch,
                   LoadRankingCsv(absl::GetFlag(FLAGS_input)));
  LOG(INFO) << "Loaded " << batch.size() << " queries from "
            << absl::GetFlag(FLAGS_input);

  ASSIGN_OR_RETURN(const auto evaluation,
                   metric::EvaluateTsrr(batch, options));

  if (absl::GetFlag(FLAGS_text_proto)) {
    ASSIGN_OR_RETURN(const auto text, utils::SerializeTextProto(evaluation));
    std::cout << text;
    return absl::OkStatus();
  }

  metric::TextReportOptions report_options;
  report_options.include_per_target =
      options.reduction() == metric::proto::NONE;
  ASSIGN_OR_RETURN(const auto report,
                   metric::TextReport(evaluation, report_options));
  std::cout << "Evaluation:" << std::endl << report;
  return absl::OkStatus();
}

}  // namespace cli
}  // namespace tsrr

int main(int argc, char** argv) {
  InitLogging(kUsageMessage, &argc, &argv, true);
  const auto status = tsrr::cli::Evaluate();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
