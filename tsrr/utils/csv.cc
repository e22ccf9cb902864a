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

#include "tsrr/utils/csv.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "tsrr/utils/status_macros.h"

namespace tsrr {
namespace utils {
namespace csv {
namespace {

// States of the row parsing automate.
enum State {
  START,
  NON_QUOTED_FIELD,
  QUOTED_FIELD,
  SECOND_QUOTE_IN_QUOTED_FIELD,
  END
};

// Tests if the character represents the end of a row i.e. new line or
// end-of-content.
bool IsEndOfRow(int c) { return c == '\n' || c == '\r' || c == -1; }

}  // namespace

Reader::Reader(absl::string_view content) : content_(content) {}

int Reader::CurrentChar() const {
  if (char_idx_ >= content_.size()) {
    return -1;
  }
  return static_cast<unsigned char>(content_[char_idx_]);
}

absl::StatusOr<bool> Reader::NextRow(std::vector<std::string>* fields) {
  fields->clear();
  if (CurrentChar() == -1) {
    return false;
  }

  std::string field;
  const auto submit_field = [&]() {
    fields->push_back(std::move(field));
    field.clear();
  };

  State state = START;
  while (state != END) {
    const int c = CurrentChar();
    switch (state) {
      case START:
        if (c == '"') {
          state = QUOTED_FIELD;
          ConsumeChar();
        } else if (IsEndOfRow(c)) {
          submit_field();
          RETURN_IF_ERROR(ConsumeEndOfRow());
          state = END;
        } else if (c == ',') {
          submit_field();
          ConsumeChar();
        } else {
          field.push_back(static_cast<char>(c));
          state = NON_QUOTED_FIELD;
          ConsumeChar();
        }
        break;

      case NON_QUOTED_FIELD:
        if (c == ',') {
          submit_field();
          state = START;
          ConsumeChar();
        } else if (c == '"') {
          return absl::InvalidArgumentError(absl::StrFormat(
              "Quote in non quoted field at line %d", num_rows_ + 1));
        } else if (IsEndOfRow(c)) {
          submit_field();
          RETURN_IF_ERROR(ConsumeEndOfRow());
          state = END;
        } else {
          field.push_back(static_cast<char>(c));
          ConsumeChar();
        }
        break;

      case QUOTED_FIELD:
        if (c == '"') {
          state = SECOND_QUOTE_IN_QUOTED_FIELD;
          ConsumeChar();
        } else if (c == -1) {
          return absl::InvalidArgumentError(absl::StrFormat(
              "End of content reached in a quote at line %d", num_rows_ + 1));
        } else {
          field.push_back(static_cast<char>(c));
          ConsumeChar();
        }
        break;

      case SECOND_QUOTE_IN_QUOTED_FIELD:
        if (c == '"') {
          field.push_back(static_cast<char>(c));
          state = QUOTED_FIELD;
          ConsumeChar();
        } else if (IsEndOfRow(c)) {
          submit_field();
          RETURN_IF_ERROR(ConsumeEndOfRow());
          state = END;
        } else if (c == ',') {
          submit_field();
          state = START;
          ConsumeChar();
        } else {
          return absl::InvalidArgumentError(absl::StrFormat(
              "Unexpected character after quote: '%c' at line %d", c,
              num_rows_ + 1));
        }
        break;

      case END:
        break;
    }
  }
  num_rows_++;
  return true;
}

absl::Status Reader::ConsumeEndOfRow() {
  if (!IsEndOfRow(CurrentChar())) {
    return absl::InternalError(absl::StrFormat(
        "The current character is not an end of row at line %d",
        num_rows_ + 1));
  }
  if (CurrentChar() == '\r') {
    ConsumeChar();
  }
  if (CurrentChar() == '\n') {
    ConsumeChar();
  }
  return absl::OkStatus();
}

}  // namespace csv
}  // namespace utils
}  // namespace tsrr
