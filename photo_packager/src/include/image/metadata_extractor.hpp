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

#include <cstddef>
#include <cstdint>
#include <exiv2/exiv2.hpp>

#include "type/type.hpp"

namespace photopackager {
/**
 * @brief The embedded metadata of one decoded image. Read-only input for derivatives, never
 * written back to the source.
 */
struct MetadataBlock {
  Exiv2::ExifData exif_{};
  Exiv2::XmpData  xmp_{};
  Exiv2::IptcData iptc_{};

  auto            Empty() const -> bool { return exif_.empty() && xmp_.empty() && iptc_.empty(); }
  auto            TagCount() const -> size_t { return exif_.count() + xmp_.count() + iptc_.count(); }
};

class MetadataExtractor {
 public:
  /**
   * @brief Initialize Exiv2's XMP toolkit once per process with a lock, so XMP can be parsed and
   * serialized from several worker threads. Later calls do nothing.
   */
  static void InitializeXmp();

  /**
   * @brief Extract EXIF, XMP and IPTC from an encoded image held in memory
   *
   * @param buffer
   * @param size
   * @return MetadataBlock
   * @throws Exiv2::Error if the buffer is not an image Exiv2 understands
   */
  static auto ExtractFromBuffer(const uint8_t* buffer, size_t size) -> MetadataBlock;

  /**
   * @brief Extract metadata from an image file on disk
   *
   * @param image_path
   * @return MetadataBlock
   */
  static auto ExtractFromFile(const image_path_t& image_path) -> MetadataBlock;

  /**
   * @brief EXIF orientation (1..8), 1 when absent or out of range
   */
  static auto ReadOrientation(const MetadataBlock& block) -> int;
};
}  // namespace photopackager
