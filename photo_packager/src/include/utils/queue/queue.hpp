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

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace photopackager {
/**
 * @brief A thread-safe blocking queue that can be closed.
 *
 * After close() producers are ignored and consumers drain what is left, then receive
 * std::nullopt instead of blocking forever.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  ConcurrentBlockingQueue() = default;

  /**
   * @brief A thread-safe wrapper for the underlying push()
   *
   * @param item
   * @return false if the queue was already closed
   */
  bool push(T item) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      if (closed_) return false;
      queue_.push(std::move(item));
    }
    consumer_cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until an element is available or the queue is closed and empty
   */
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    consumer_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return TakeFront();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    consumer_cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return TakeFront();
  }

  std::optional<T> try_pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    return TakeFront();
  }

  void close() {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      closed_ = true;
    }
    consumer_cv_.notify_all();
  }

  bool closed() const {
    std::unique_lock<std::mutex> lock(mtx_);
    return closed_;
  }

  size_t size() const {
    std::unique_lock<std::mutex> lock(mtx_);
    return queue_.size();
  }

 private:
  // Caller holds mtx_
  std::optional<T> TakeFront() {
    if (queue_.empty()) return std::nullopt;
    T front = std::move(queue_.front());
    queue_.pop();
    return front;
  }

  std::queue<T>           queue_;
  mutable std::mutex      mtx_;
  std::condition_variable consumer_cv_;
  bool                    closed_ = false;
};
};  // namespace photopackager
