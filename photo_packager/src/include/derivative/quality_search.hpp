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

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace photopackager {
using QualityEncoder = std::function<std::vector<uint8_t>(int quality)>;

struct QualitySearchResult {
  int                  quality_     = 0;
  std::vector<uint8_t> bytes_{};
  // Encodes performed, the initial one included
  int                  encodes_     = 0;
  bool                 met_ceiling_ = true;
  std::string          warning_{};
};

/**
 * @brief Find the highest quality in [min_quality, start_quality] whose encoding fits max_bytes.
 *
 * The start quality is tried first. If it is over the ceiling a binary search runs for at most
 * max_iterations further encodes. When none of them fits, min_quality is encoded once more
 * unless the search already did, so a call costs at most max_iterations + 2 encodes. When even
 * min_quality is too large its encoding is returned with met_ceiling_ false and a warning.
 * max_bytes == 0 skips the search.
 *
 * Exceptions thrown by the encoder propagate.
 */
auto SearchQuality(const QualityEncoder& encoder, int start_quality, int min_quality,
                   byte_size_t max_bytes, int max_iterations) -> QualitySearchResult;
};  // namespace photopackager
