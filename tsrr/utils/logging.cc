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

#include "tsrr/utils/logging.h"

#include <vector>

#include "absl/base/log_severity.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"

ABSL_FLAG(bool, alsologtostderr, false, "Log all messages to stderr");

void InitLogging(const char* usage, int* argc, char*** argv,
                 bool remove_flags) {
  absl::InitializeLog();
  absl::SetProgramUsageMessage(usage);
  const std::vector<char*> positional_args =
      absl::ParseCommandLine(*argc, *argv);
  if (remove_flags) {
    // "positional_args" contains the program name followed by the non-flag
    // arguments.
    *argc = static_cast<int>(positional_args.size());
    for (int arg_idx = 0; arg_idx < *argc; arg_idx++) {
      (*argv)[arg_idx] = positional_args[arg_idx];
    }
  }
  if (absl::GetFlag(FLAGS_alsologtostderr)) {
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kInfo);
  }
}
