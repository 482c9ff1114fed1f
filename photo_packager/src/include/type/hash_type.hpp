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

#include <xxhash.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "type/type.hpp"

namespace photopackager {
/**
 * @brief 128-bit content digest used to verify copied originals before a move deletes the source.
 */
class Hash128 {
 public:
  Hash128() : h_{0, 0} {}
  explicit Hash128(const XXH128_hash_t& h) : h_(h) {}

  uint64_t    low64() const { return h_.low64; }
  uint64_t    high64() const { return h_.high64; }

  std::string ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << h_.high64;
    oss << std::setw(16) << h_.low64;
    return oss.str();
  }

  bool operator==(const Hash128& other) const noexcept {
    return h_.low64 == other.h_.low64 && h_.high64 == other.h_.high64;
  }
  bool           operator!=(const Hash128& other) const noexcept { return !(*this == other); }

  static Hash128 Compute(const void* data, size_t length, uint64_t seed = 0) {
    return Hash128(XXH3_128bits_withSeed(data, length, seed));
  }

  /**
   * @brief Stream a file through XXH3-128 without loading it into memory.
   *
   * @param path
   * @return Hash128
   * @throws std::runtime_error if the file cannot be opened or read
   */
  static Hash128 ComputeFile(const file_path_t& path);

 private:
  XXH128_hash_t h_;
};
};  // namespace photopackager
