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
#include <string>

namespace photopackager {
/**
 * @brief Wall-clock time anchored to a steady clock at construction, so timestamps taken from
 * one instance never run backwards when the system clock is adjusted.
 *
 * Each job owns its own instance. Now() is safe to call from any thread.
 */
class TimeProvider {
 public:
  TimeProvider();

  auto        Now() const -> std::chrono::system_clock::time_point;
  auto        Anchor() const -> std::chrono::system_clock::time_point { return anchor_sys_; }

  static auto TimePointToString(const std::chrono::system_clock::time_point& tp,
                                const char* format = "%Y-%m-%d %H:%M:%S") -> std::string;

 private:
  std::chrono::system_clock::time_point anchor_sys_;
  std::chrono::steady_clock::time_point anchor_steady_;
};
};  // namespace photopackager
