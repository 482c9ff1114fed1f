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

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace photopackager {
/**
 * @brief Fixed-size worker pool. Tasks run in submission order; the destructor drains the queue
 * before joining.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * @brief Queue a task.
   *
   * @return std::future<void> carries any exception the task throws
   */
  auto Submit(std::function<void()> task) -> std::future<void>;

  auto Size() const -> size_t { return workers_.size(); }

 private:
  void                                          WorkerThread();

  std::queue<std::packaged_task<void()>>        tasks_;
  std::mutex                                    mtx_;
  std::condition_variable                       condition_;
  std::vector<std::thread>                      workers_;

  bool                                          stop_ = false;
};
};  // namespace photopackager
