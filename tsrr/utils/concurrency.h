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

// Parallel execution of independent jobs.
//
// Usage example:
//
//   std::vector<double> outputs(inputs.size());
//   RETURN_IF_ERROR(ConcurrentForLoop(
//       inputs.size(), /*num_threads=*/4,
//       [&](size_t block_idx, size_t begin_idx,
//           size_t end_idx) -> absl::Status {
//         for (size_t i = begin_idx; i < end_idx; i++) {
//           ASSIGN_OR_RETURN(outputs[i], Process(inputs[i]));
//         }
//         return absl::OkStatus();
//       }));
//

#ifndef TSRR_UTILS_CONCURRENCY_H_
#define TSRR_UTILS_CONCURRENCY_H_

#include <stddef.h>

#include <functional>
#include <utility>

#include "absl/status/status.h"

namespace tsrr::utils::concurrency {

// Applies "function" over a range of elements using multi-threading.
//
// The "num_items" elements are divided into contiguous blocks of (up to) the
// same size. Each block is processed by exactly one call to "function". The
// blocks are distributed over "num_threads" threads. If "num_threads <= 1", all
// the blocks are processed by the calling thread.
//
// The method is blocking until all the "function" calls have returned. If a
// call fails, no new block is started and the first failure is returned.
//
// function's signature:
//   block_idx: Index of the block.
//   begin_item_idx: First item to process (inclusive).
//   end_item_idx: Last item to process (exclusive).
//
absl::Status ConcurrentForLoop(
    size_t num_items, int num_threads,
    const std::function<absl::Status(size_t block_idx, size_t begin_item_idx,
                                     size_t end_item_idx)>& function,
    size_t min_block_size = 1);

namespace internal {

// Computes the block size and the number of threads. The block size is at
// least "min_block_size" and no more threads than blocks are used.
std::pair<size_t, size_t> GetConfig(size_t num_items, size_t max_num_threads,
                                    size_t min_block_size);

}  // namespace internal
}  // namespace tsrr::utils::concurrency

#endif  // TSRR_UTILS_CONCURRENCY_H_
