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

#include "app/job_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>

#include "concurrency/thread_pool.hpp"

namespace photopackager {
auto JobScheduler::Run(const std::vector<SourceEntry>& entries, const FileTask& task,
                       const FileTask& on_canceled, const std::atomic<bool>& cancel,
                       const ProgressCallback& on_progress) const -> SchedulerStats {
  const uint32_t        total = static_cast<uint32_t>(entries.size());
  std::atomic<uint32_t> processed{0};
  std::atomic<uint32_t> canceled{0};
  std::atomic<uint32_t> done{0};

  auto                  run_one = [&](const SourceEntry& entry) {
    if (cancel.load()) {
      on_canceled(entry);
      canceled.fetch_add(1);
    } else {
      task(entry);
      processed.fetch_add(1);
    }
    const uint32_t finished = done.fetch_add(1) + 1;
    if (on_progress) on_progress(finished, total);
  };

  if (worker_count_ == 1 || entries.size() <= 1) {
    for (const auto& entry : entries) {
      run_one(entry);
    }
  } else {
    std::vector<std::future<void>> pending;
    pending.reserve(entries.size());
    {
      ThreadPool pool(std::min(worker_count_, entries.size()));
      for (const auto& entry : entries) {
        pending.push_back(pool.Submit([&run_one, &entry] { run_one(entry); }));
      }
      // Pool destructor drains the queue and joins
    }

    std::exception_ptr first_error;
    for (auto& future : pending) {
      try {
        future.get();
      } catch (...) {
        if (!first_error) first_error = std::current_exception();
      }
    }
    if (first_error) std::rethrow_exception(first_error);
  }

  SchedulerStats stats;
  stats.total_     = total;
  stats.processed_ = processed.load();
  stats.canceled_  = canceled.load();
  return stats;
}
};  // namespace photopackager
