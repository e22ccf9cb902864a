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

// Reading and writing of whole local files.

#ifndef TSRR_UTILS_FILESYSTEM_H_
#define TSRR_UTILS_FILESYSTEM_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace file {

// Reads the content of a file.
absl::StatusOr<std::string> GetContent(absl::string_view path);

// Sets the content of a file. Overrides the file if it already exists.
absl::Status SetContent(absl::string_view path, absl::string_view content);

}  // namespace file

#endif  // TSRR_UTILS_FILESYSTEM_H_
