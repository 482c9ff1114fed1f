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

#include <opencv2/core.hpp>
#include <string>

#include "image/metadata_extractor.hpp"
#include "type/type.hpp"

namespace photopackager {
/**
 * @brief A source image ready for derivative encoding.
 *
 * Pixels are 8-bit BGR, or BGRA when the source carries alpha, already rotated upright.
 */
struct DecodedImage {
  cv::Mat       pixels_{};
  MetadataBlock metadata_{};
  // Orientation found in the source before normalization
  int           source_orientation_ = 1;
  bool          has_alpha_          = false;
  // Set when metadata could not be parsed; pixels are still usable
  std::string   metadata_error_{};
};

class ImageDecoder {
 public:
  /**
   * @brief Decode an image file and normalize its orientation.
   *
   * @param image_path
   * @return DecodedImage
   * @throws std::runtime_error if the file cannot be read or decoded
   */
  static auto Decode(const image_path_t& image_path) -> DecodedImage;

  /**
   * @brief Rotate or mirror pixels so that EXIF orientation 1 displays them correctly.
   *
   * @param pixels
   * @param orientation EXIF orientation 1..8
   * @return cv::Mat
   */
  static auto ApplyOrientation(const cv::Mat& pixels, int orientation) -> cv::Mat;
};
};  // namespace photopackager
