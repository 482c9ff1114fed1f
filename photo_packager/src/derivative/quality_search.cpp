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

#include "derivative/quality_search.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace photopackager {
auto SearchQuality(const QualityEncoder& encoder, int start_quality, int min_quality,
                   byte_size_t max_bytes, int max_iterations) -> QualitySearchResult {
  QualitySearchResult result;
  min_quality        = std::min(min_quality, start_quality);

  result.quality_    = start_quality;
  result.bytes_      = encoder(start_quality);
  result.encodes_    = 1;
  if (max_bytes == 0 || result.bytes_.size() <= max_bytes) {
    return result;
  }

  int                  low  = min_quality;
  int                  high = start_quality - 1;
  int                  best_quality = -1;
  std::vector<uint8_t> best_bytes;
  std::vector<uint8_t> low_bytes;
  bool                 low_encoded = false;

  for (int i = 0; i < max_iterations && low <= high; ++i) {
    const int mid     = low + (high - low + 1) / 2;
    auto      encoded = encoder(mid);
    ++result.encodes_;
    if (encoded.size() <= max_bytes) {
      best_quality = mid;
      best_bytes   = std::move(encoded);
      low          = mid + 1;
    } else {
      if (mid == min_quality) {
        low_bytes   = std::move(encoded);
        low_encoded = true;
      }
      high = mid - 1;
    }
  }

  if (best_quality >= 0) {
    result.quality_ = best_quality;
    result.bytes_   = std::move(best_bytes);
    return result;
  }

  // Nothing fit within the iteration budget: settle for the floor
  if (!low_encoded && start_quality != min_quality) {
    low_bytes = encoder(min_quality);
    ++result.encodes_;
  } else if (!low_encoded) {
    low_bytes = result.bytes_;
  }
  result.quality_ = min_quality;
  result.bytes_   = std::move(low_bytes);
  if (result.bytes_.size() <= max_bytes) {
    return result;
  }
  result.met_ceiling_ = false;
  result.warning_     = "size ceiling of " + std::to_string(max_bytes) +
                    " bytes not met at minimum quality " + std::to_string(min_quality) + " (" +
                    std::to_string(result.bytes_.size()) + " bytes)";
  return result;
}
};  // namespace photopackager
