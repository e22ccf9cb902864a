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

// Creation of textual reports of TsRR evaluations.

#ifndef TSRR_METRIC_REPORT_H_
#define TSRR_METRIC_REPORT_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tsrr/metric/tsrr.pb.h"

namespace tsrr {
namespace metric {

struct TextReportOptions {
  // If true, lists the score of each target.
  bool include_per_target = false;
};

// Textual report of the evaluation.
absl::StatusOr<std::string> TextReport(const proto::TsrrEvaluation& eval,
                                       const TextReportOptions& options = {});

// Appends a textual report of the evaluation. Fails if the evaluation is
// inconsistent e.g. the number of per-target scores does not match the number
// of targets.
absl::Status AppendTextReport(const proto::TsrrEvaluation& eval,
                              std::string* report,
                              const TextReportOptions& options = {});

}  // namespace metric
}  // namespace tsrr

#endif  // TSRR_METRIC_REPORT_H_
