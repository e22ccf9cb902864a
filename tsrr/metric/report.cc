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

#include "tsrr/metric/report.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "tsrr/metric/tsrr.pb.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace metric {

absl::StatusOr<std::string> TextReport(const proto::TsrrEvaluation& eval,
                                       const TextReportOptions& options) {
  std::string report;
  RETURN_IF_ERROR(AppendTextReport(eval, &report, options));
  return report;
}

absl::Status AppendTextReport(const proto::TsrrEvaluation& eval,
                              std::string* report,
                              const TextReportOptions& options) {
  STATUS_CHECK_EQ(eval.per_target_size(), eval.num_targets());
  STATUS_CHECK_LE(eval.num_found(), eval.num_targets());

  absl::StrAppend(report, "Number of targets: ", eval.num_targets(), "\n");
  absl::StrAppend(report, "Number of targets found: ", eval.num_found(), "\n");
  absl::StrAppend(report, "Number of targets tied with irrelevant candidates: ",
                  eval.num_tied_with_irrelevant(), "\n");
  if (eval.has_mean()) {
    absl::StrAppend(report, "TsRR: ", eval.mean(), "\n");
  } else {
    absl::StrAppend(report, "TsRR: N/A\n");
  }

  if (options.include_per_target) {
    absl::StrAppend(report, "Per-target TsRR:\n");
    for (int target_idx = 0; target_idx < eval.per_target_size();
         target_idx++) {
      absl::SubstituteAndAppend(report, "\t#$0: $1\n", target_idx,
                                eval.per_target(target_idx));
    }
  }
  return absl::OkStatus();
}

}  // namespace metric
}  // namespace tsrr
