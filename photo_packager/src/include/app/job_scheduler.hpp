//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "scanner/source_scanner.hpp"

namespace photopackager {
struct SchedulerStats {
  uint32_t total_     = 0;
  uint32_t processed_ = 0;
  uint32_t canceled_  = 0;
};

/**
 * @brief Runs one task per source entry across a bounded worker pool.
 *
 * The cancel flag is read before each entry starts. Entries already running finish; entries not
 * yet started go to the canceled callback instead of the task.
 */
class JobScheduler {
 public:
  using FileTask         = std::function<void(const SourceEntry&)>;
  using ProgressCallback = std::function<void(uint32_t done, uint32_t total)>;

  // worker_count must already be resolved; 1 runs on the calling thread
  explicit JobScheduler(size_t worker_count) : worker_count_(worker_count == 0 ? 1 : worker_count) {}

  /**
   * @brief Process all entries and block until every one is done or canceled.
   *
   * @throws whatever a task throws, after all submitted work has finished
   */
  auto Run(const std::vector<SourceEntry>& entries, const FileTask& task,
           const FileTask& on_canceled, const std::atomic<bool>& cancel,
           const ProgressCallback& on_progress = {}) const -> SchedulerStats;

  auto WorkerCount() const -> size_t { return worker_count_; }

 private:
  size_t worker_count_;
};
};  // namespace photopackager
