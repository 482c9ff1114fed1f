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
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "image/metadata_extractor.hpp"
#include "job/job_spec.hpp"

namespace photopackager {
struct EncodeOptions {
  ImageFormatType format_  = ImageFormatType::JPEG;
  int             quality_ = 90;
};

/**
 * @brief Turns 8-bit BGR(A) pixels into JPEG or WebP bytes, optionally carrying a metadata block.
 *
 * Encoding happens entirely in memory so the same call serves live runs, dry runs and the size
 * trial encodes of the quality search.
 */
class ImageWriter {
 public:
  /**
   * @brief Encode pixels and embed metadata.
   *
   * A metadata embedding failure does not fail the call: the plain encoding is returned and the
   * cause lands in metadata_warning when it is non-null.
   *
   * @param pixels 8-bit BGR or BGRA
   * @param options
   * @param metadata nullptr or an empty block writes a file without metadata
   * @param metadata_warning
   * @return std::vector<uint8_t>
   * @throws std::runtime_error if the encoder rejects the image
   */
  static auto Encode(const cv::Mat& pixels, const EncodeOptions& options,
                     const MetadataBlock* metadata, std::string* metadata_warning = nullptr)
      -> std::vector<uint8_t>;

  static auto EncodePixels(const cv::Mat& pixels, const EncodeOptions& options)
      -> std::vector<uint8_t>;

  /**
   * @brief Rewrite an encoded image with the given metadata. Orientation is forced to 1, any EXIF
   * thumbnail is dropped and pixel dimension tags follow the new size.
   *
   * @throws Exiv2::Error on failure
   */
  static auto EmbedMetadata(const std::vector<uint8_t>& encoded, const MetadataBlock& metadata,
                            ImageFormatType format, int width, int height)
      -> std::vector<uint8_t>;
};
};  // namespace photopackager
