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

// RFC 4180-compliant CSV reader over an in-memory buffer.
// See https://tools.ietf.org/html/rfc4180
//
// Usage example:
//
//   Reader reader(content);
//   std::vector<std::string> row;
//   while (reader.NextRow(&row).value()) {
//     // Do something with "row".
//   }
//
// Highlights from RFC4180:
//  - Fields are separated by commas.
//  - Fields can be escaped with double quotes.
//  - Double quotes are escaped by using a pair of double-quotes.
//
// Supports Unix, Windows and Mac new lines.
//
#ifndef TSRR_UTILS_CSV_H_
#define TSRR_UTILS_CSV_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace tsrr {
namespace utils {
namespace csv {

class Reader {
 public:
  // Does not copy "content". "content" should outlive the reader.
  explicit Reader(absl::string_view content);

  // Reads the next row into "fields". Returns false when no new rows are
  // available.
  absl::StatusOr<bool> NextRow(std::vector<std::string>* fields);

  // Number of rows read so far.
  int num_rows() const { return num_rows_; }

 private:
  // Current character i.e. the last one read. -1 at the end of the content.
  int CurrentChar() const;

  void ConsumeChar() { char_idx_++; }

  // Consumes character(s) representing a end of line.
  absl::Status ConsumeEndOfRow();

  absl::string_view content_;

  // Index, in "content_", of the current character.
  size_t char_idx_ = 0;

  int num_rows_ = 0;
};

}  // namespace csv
}  // namespace utils
}  // namespace tsrr

#endif  // TSRR_UTILS_CSV_H_
