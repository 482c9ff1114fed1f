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

#include "io/image/image_writer.hpp"

#include <algorithm>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace photopackager {
namespace {
auto FormatSupportsAlpha(ImageFormatType fmt) -> bool { return fmt == ImageFormatType::WEBP; }

// Pixels were already rotated by the decoder; a stale tag would make viewers rotate again
auto ForceUprightOrientation(Exiv2::ExifData& exif) -> void {
  exif["Exif.Image.Orientation"] = static_cast<uint16_t>(1);
}

auto ForceUprightOrientation(Exiv2::XmpData& xmp) -> void {
  if (xmp.findKey(Exiv2::XmpKey("Xmp.tiff.Orientation")) != xmp.end()) {
    xmp["Xmp.tiff.Orientation"] = std::string("1");
  }
}
}  // namespace

auto ImageWriter::EncodePixels(const cv::Mat& pixels, const EncodeOptions& options)
    -> std::vector<uint8_t> {
  if (pixels.empty()) {
    throw std::runtime_error("ImageWriter: image data is empty");
  }
  if (pixels.depth() != CV_8U) {
    throw std::runtime_error("ImageWriter: expected 8-bit image data");
  }

  cv::Mat encoded_input;
  if (pixels.channels() == 4 && !FormatSupportsAlpha(options.format_)) {
    cv::cvtColor(pixels, encoded_input, cv::COLOR_BGRA2BGR);
  } else if (pixels.channels() == 1) {
    cv::cvtColor(pixels, encoded_input, cv::COLOR_GRAY2BGR);
  } else {
    encoded_input = pixels;
  }

  std::vector<int> params;
  std::string      ext;
  switch (options.format_) {
    case ImageFormatType::JPEG:
      ext    = ".jpg";
      params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(options.quality_, 0, 100)};
      break;
    case ImageFormatType::WEBP:
      // Values above 100 switch libwebp to lossless
      ext    = ".webp";
      params = {cv::IMWRITE_WEBP_QUALITY, std::clamp(options.quality_, 1, 100)};
      break;
  }

  std::vector<uint8_t> buffer;
  try {
    if (!cv::imencode(ext, encoded_input, buffer, params)) {
      throw std::runtime_error("ImageWriter: OpenCV: imencode returned false for " + ext);
    }
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::string("ImageWriter: OpenCV: ") + e.what());
  }
  return buffer;
}

auto ImageWriter::EmbedMetadata(const std::vector<uint8_t>& encoded, const MetadataBlock& metadata,
                                ImageFormatType format, int width, int height)
    -> std::vector<uint8_t> {
  MetadataExtractor::InitializeXmp();
  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(encoded.data(), encoded.size());
  if (image.get() == nullptr) {
    throw Exiv2::Error(Exiv2::ErrorCode::kerErrorMessage, "cannot open encoded buffer");
  }

  Exiv2::ExifData exif = metadata.exif_;
  Exiv2::XmpData  xmp  = metadata.xmp_;
  ForceUprightOrientation(xmp);
  if (!exif.empty()) {
    Exiv2::ExifThumb thumb(exif);
    thumb.erase();
    ForceUprightOrientation(exif);
    exif["Exif.Photo.PixelXDimension"] = static_cast<uint32_t>(width);
    exif["Exif.Photo.PixelYDimension"] = static_cast<uint32_t>(height);
  }

  image->setExifData(exif);
  image->setXmpData(xmp);
  if (format == ImageFormatType::JPEG) {
    image->setIptcData(metadata.iptc_);
  }
  image->writeMetadata();

  Exiv2::BasicIo& io = image->io();
  io.seek(0, Exiv2::BasicIo::beg);
  Exiv2::DataBuf       data = io.read(io.size());
  std::vector<uint8_t> out(data.c_data(), data.c_data() + data.size());
  if (out.empty()) {
    throw Exiv2::Error(Exiv2::ErrorCode::kerErrorMessage, "metadata rewrite produced no data");
  }
  return out;
}

auto ImageWriter::Encode(const cv::Mat& pixels, const EncodeOptions& options,
                         const MetadataBlock* metadata, std::string* metadata_warning)
    -> std::vector<uint8_t> {
  std::vector<uint8_t> plain = EncodePixels(pixels, options);
  if (metadata == nullptr || metadata->Empty()) {
    return plain;
  }

  try {
    return EmbedMetadata(plain, *metadata, options.format_, pixels.cols, pixels.rows);
  } catch (const std::exception& e) {
    if (metadata_warning != nullptr) {
      *metadata_warning = std::string("metadata not embedded: ") + e.what();
    }
  }
  return plain;
}
};  // namespace photopackager
