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

// Utilities for the manipulation of Protobufs.

#ifndef TSRR_UTILS_PROTOBUF_H_
#define TSRR_UTILS_PROTOBUF_H_

#include <string>
#include <typeinfo>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/text_format.h"

namespace tsrr {
namespace utils {

// Deserializes a proto from its text representation.
template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view raw) {
  T message;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(raw),
                                                     &message)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse protobuf ", typeid(T).name(), " from text"));
  }
  return message;
}

// Serializes a proto into its text representation.
template <typename T>
absl::StatusOr<std::string> SerializeTextProto(const T& message,
                                               bool single_line_mode = false) {
  std::string serialized_message;
  google::protobuf::TextFormat::Printer printer;
  if (single_line_mode) {
    printer.SetSingleLineMode(true);
  }
  if (!printer.PrintToString(message, &serialized_message)) {
    return absl::InvalidArgumentError("Cannot serialize proto message.");
  }
  if (single_line_mode && !serialized_message.empty() &&
      serialized_message.back() == ' ') {
    serialized_message.pop_back();
  }
  return serialized_message;
}

}  // namespace utils
}  // namespace tsrr

#endif  // TSRR_UTILS_PROTOBUF_H_
