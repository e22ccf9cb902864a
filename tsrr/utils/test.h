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

// Utilities for unit testing.

#ifndef TSRR_UTILS_TEST_H_
#define TSRR_UTILS_TEST_H_

#include <string>

#include "gmock/gmock.h"
#include "absl/strings/match.h"

namespace tsrr {
namespace test {

// Tests that a absl::Status is of specific type, and contains a specific text.
//
// Usage example:
//    EXPECT_THAT(..., StatusIs(absl::StatusCode::kInvalidArgument, "ABC"));
MATCHER_P2(StatusIs, type, message_contains,
           "Status is " + testing::PrintToString(type) +
               " and contains message \"" +
               testing::PrintToString(message_contains) + "\"") {
  return arg.code() == type &&
         absl::StrContains(arg.message(), message_contains);
}

MATCHER_P(StatusIs, type, "Status is " + testing::PrintToString(type)) {
  return arg.code() == type;
}

MATCHER(StatusIsOk, "Status is OK") { return arg.ok(); }

#ifndef EXPECT_OK
#define EXPECT_OK(expr) EXPECT_THAT(expr, ::tsrr::test::StatusIsOk())
#endif
#ifndef ASSERT_OK
#define ASSERT_OK(expr) ASSERT_THAT(expr, ::tsrr::test::StatusIsOk())
#endif

}  // namespace test
}  // namespace tsrr

#endif  // TSRR_UTILS_TEST_H_
