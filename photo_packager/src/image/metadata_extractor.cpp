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

#include "image/metadata_extractor.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace photopackager {
namespace {
void XmpLock(void* data, bool lock) {
  auto* mtx = static_cast<std::recursive_mutex*>(data);
  if (lock) {
    mtx->lock();
  } else {
    mtx->unlock();
  }
}

auto CollectBlock(Exiv2::Image& image) -> MetadataBlock {
  image.readMetadata();
  MetadataBlock block;
  block.exif_ = image.exifData();
  block.xmp_  = image.xmpData();
  block.iptc_ = image.iptcData();
  return block;
}
}  // namespace

void MetadataExtractor::InitializeXmp() {
  static std::recursive_mutex xmp_mtx;
  static std::once_flag       xmp_once;
  std::call_once(xmp_once, [] {
    if (!Exiv2::XmpParser::initialize(XmpLock, &xmp_mtx)) {
      throw std::runtime_error("MetadataExtractor: XMP toolkit initialization failed");
    }
  });
}

auto MetadataExtractor::ExtractFromBuffer(const uint8_t* buffer, size_t size) -> MetadataBlock {
  if (!buffer || size == 0) {
    throw std::runtime_error("MetadataExtractor: empty buffer");
  }
  InitializeXmp();
  Exiv2::Image::UniquePtr image =
      Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(buffer), size);
  return CollectBlock(*image);
}

auto MetadataExtractor::ExtractFromFile(const image_path_t& image_path) -> MetadataBlock {
  InitializeXmp();
  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(image_path.string());
  return CollectBlock(*image);
}

auto MetadataExtractor::ReadOrientation(const MetadataBlock& block) -> int {
  auto it = block.exif_.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
  if (it == block.exif_.end() || it->count() == 0) {
    return 1;
  }
  const auto value = it->toInt64();
  if (value < 1 || value > 8) {
    return 1;
  }
  return static_cast<int>(value);
}
}  // namespace photopackager
