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

#include "tsrr/utils/concurrency.h"

#include <stddef.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>  // NOLINT
#include <tuple>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

namespace tsrr::utils::concurrency {

absl::Status ConcurrentForLoop(
    const size_t num_items, const int num_threads,
    const std::function<absl::Status(size_t block_idx, size_t begin_item_idx,
                                     size_t end_item_idx)>& function,
    const size_t min_block_size) {
  if (num_items == 0) {
    return absl::OkStatus();
  }
  if (num_threads <= 1) {
    return function(0, 0, num_items);
  }

  size_t block_size, effective_num_threads;
  std::tie(block_size, effective_num_threads) =
      internal::GetConfig(num_items, num_threads, min_block_size);
  const size_t num_blocks = (num_items + block_size - 1) / block_size;
  if (effective_num_threads <= 1) {
    return function(0, 0, num_items);
  }

  // Next block to process.
  std::atomic<size_t> next_block_idx{0};

  // Aggregated failure status of the individual jobs. Guarded by
  // "global_status_mutex".
  absl::Mutex global_status_mutex;
  absl::Status global_status;

  // Does "global_status" contain a failure?
  std::atomic<bool> has_failure{false};

  const auto thread_loop = [&]() {
    while (!has_failure) {
      const size_t block_idx = next_block_idx++;
      if (block_idx >= num_blocks) {
        break;
      }
      const size_t begin_item_idx = block_idx * block_size;
      const size_t end_item_idx =
          std::min(begin_item_idx + block_size, num_items);
      const auto status = function(block_idx, begin_item_idx, end_item_idx);
      if (!status.ok()) {
        absl::MutexLock l(&global_status_mutex);
        global_status.Update(status);
        has_failure = true;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(effective_num_threads);
  for (size_t thread_idx = 0; thread_idx < effective_num_threads;
       thread_idx++) {
    threads.emplace_back(thread_loop);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  absl::MutexLock l(&global_status_mutex);
  return global_status;
}

namespace internal {

std::pair<size_t, size_t> GetConfig(const size_t num_items,
                                    const size_t max_num_threads,
                                    const size_t min_block_size) {
  size_t block_size = (num_items + max_num_threads - 1) / max_num_threads;
  block_size = std::max({block_size, min_block_size, size_t{1}});

  size_t num_threads = (num_items + block_size - 1) / block_size;
  num_threads = std::clamp(num_threads, size_t{1}, max_num_threads);
  return std::make_pair(block_size, num_threads);
}

}  // namespace internal
}  // namespace tsrr::utils::concurrency
