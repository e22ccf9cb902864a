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

// Utility macros for the manipulation of absl's status.

#ifndef TSRR_UTILS_STATUS_MACROS_H_
#define TSRR_UTILS_STATUS_MACROS_H_

#include <string>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "tsrr/utils/logging.h"

// Evaluates an expression returning a absl::Status. Returns with the status
// if the status is not "OK".
//
// Usage example:
//   absl::Status f() {
//     auto g = []() -> absl::Status { ... };
//     RETURN_IF_ERROR(g());
//     return absl::OkStatus();
//   }
#ifndef RETURN_IF_ERROR
#define RETURN_IF_ERROR(expr)                \
  {                                          \
    auto _status = (expr);                   \
    if (ABSL_PREDICT_FALSE(!_status.ok())) { \
      return _status;                        \
    }                                        \
  }
#endif

#define TSRR_TOKEN_PASTE(x, y) x##y
#define TSRR_CONCATENATE(x, y) TSRR_TOKEN_PASTE(x, y)

// Evaluates an expression returning a absl::StatusOr. Returns with the status
// if the status is not "OK". Move the value to "lhs" and continue the execution
// otherwise.
//
// Usage example:
//   absl::Status f() {
//     auto g = []() -> absl::StatusOr<int> { ... };
//     ASSIGN_OR_RETURN(const auto x, g());
//     return absl::OkStatus();
//   }
//
// A third argument containing a extra error message is possible. The message
// is logged as a warning when the expression fails.
//
// Usage example:
//   ASSIGN_OR_RETURN(const auto x, g(), _ << "Extra information");
#define ASSIGN_OR_RETURN(...)                                             \
  TSRR_SELECT_FOURTH_ARGUMENT_FROM_LIST(                                  \
      (__VA_ARGS__, ASSIGN_OR_RETURN_3ARGS, ASSIGN_OR_RETURN_2ARGS))      \
  (__VA_ARGS__)

#define ASSIGN_OR_RETURN_2ARGS(lhs, rexpr) \
  ASSIGN_OR_RETURN_2ARGS_IMP(lhs, rexpr,   \
                             TSRR_CONCATENATE(_status_or_value, __LINE__))

#define ASSIGN_OR_RETURN_3ARGS(lhs, rexpr, message) \
  ASSIGN_OR_RETURN_3ARGS_IMP(lhs, rexpr, message,   \
                             TSRR_CONCATENATE(_status_or_value, __LINE__))

#define TSRR_SELECT_FOURTH_ARGUMENT(_1, _2, _3, _4, ...) _4
#define TSRR_SELECT_FOURTH_ARGUMENT_FROM_LIST(args) \
  TSRR_SELECT_FOURTH_ARGUMENT args

#define ASSIGN_OR_RETURN_2ARGS_IMP(lhs, rexpr, tmpvar) \
  auto tmpvar = (rexpr);                               \
  if (ABSL_PREDICT_FALSE(!tmpvar.ok())) {              \
    return tmpvar.status();                            \
  }                                                    \
  lhs = std::move(tmpvar).value()

#define ASSIGN_OR_RETURN_3ARGS_IMP(lhs, rexpr, message, tmpvar) \
  auto tmpvar = (rexpr);                                        \
  if (ABSL_PREDICT_FALSE(!tmpvar.ok())) {                       \
    std::string _;                                              \
    LOG(WARNING) << message;                                    \
    return tmpvar.status();                                     \
  }                                                             \
  lhs = std::move(tmpvar).value()

// NOLINTBEGIN
#define STATUS_CHECK(expr) \
  if (!(expr)) return absl::InvalidArgumentError("Check failed " #expr)
#define STATUS_CHECK_EQ(a, b) STATUS_CHECK(a == b)
#define STATUS_CHECK_NE(a, b) STATUS_CHECK(a != b)
#define STATUS_CHECK_GE(a, b) STATUS_CHECK(a >= b)
#define STATUS_CHECK_LE(a, b) STATUS_CHECK(a <= b)
#define STATUS_CHECK_GT(a, b) STATUS_CHECK(a > b)
#define STATUS_CHECK_LT(a, b) STATUS_CHECK(a < b)
// NOLINTEND

#endif  // TSRR_UTILS_STATUS_MACROS_H_
