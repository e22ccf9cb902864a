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

#include "tsrr/utils/filesystem.h"

#include <fstream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace file {

absl::StatusOr<std::string> GetContent(absl::string_view path) {
  std::ifstream stream(std::string(path), std::ios::binary);
  if (!stream.is_open()) {
    return absl::NotFoundError(absl::StrCat("Cannot open file ", path));
  }
  std::stringstream buffer;
  buffer << stream.rdbuf();
  if (stream.bad()) {
    return absl::DataLossError(absl::StrCat("Cannot read file ", path));
  }
  return buffer.str();
}

absl::Status SetContent(absl::string_view path, absl::string_view content) {
  std::ofstream stream(std::string(path), std::ios::binary | std::ios::trunc);
  if (!stream.is_open()) {
    return absl::PermissionDeniedError(
        absl::StrCat("Cannot open file ", path, " for writing"));
  }
  stream.write(content.data(), content.size());
  stream.close();
  if (stream.fail()) {
    return absl::DataLossError(absl::StrCat("Cannot write file ", path));
  }
  return absl::OkStatus();
}

}  // namespace file
