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

#include "decoders/image_decoder.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iterator>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <vector>

namespace photopackager {
namespace {
auto ReadFileBytes(const image_path_t& path) -> std::vector<uint8_t> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw std::runtime_error("ImageDecoder: cannot open " + path.string());
  }
  const std::streamsize size = file.tellg();
  if (size <= 0) {
    throw std::runtime_error("ImageDecoder: empty file " + path.string());
  }
  file.seekg(0, std::ios::beg);
  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
    throw std::runtime_error("ImageDecoder: read error on " + path.string());
  }
  return buffer;
}

// Bring any decoded layout to 8-bit BGR(A)
auto ToBgr8(const cv::Mat& decoded) -> cv::Mat {
  cv::Mat depth8;
  switch (decoded.depth()) {
    case CV_8U:
      depth8 = decoded;
      break;
    case CV_16U:
      decoded.convertTo(depth8, CV_MAKETYPE(CV_8U, decoded.channels()), 1.0 / 257.0);
      break;
    case CV_32F:
    case CV_64F:
      decoded.convertTo(depth8, CV_MAKETYPE(CV_8U, decoded.channels()), 255.0);
      break;
    default:
      decoded.convertTo(depth8, CV_MAKETYPE(CV_8U, decoded.channels()));
      break;
  }

  cv::Mat out;
  switch (depth8.channels()) {
    case 1:
      cv::cvtColor(depth8, out, cv::COLOR_GRAY2BGR);
      break;
    case 2: {
      // Gray + alpha
      std::vector<cv::Mat> planes;
      cv::split(depth8, planes);
      std::vector<cv::Mat> bgra = {planes[0], planes[0], planes[0], planes[1]};
      cv::merge(bgra, out);
      break;
    }
    case 3:
    case 4:
      out = depth8;
      break;
    default:
      throw std::runtime_error("ImageDecoder: unsupported channel count " +
                               std::to_string(depth8.channels()));
  }
  return out;
}
}  // namespace

auto ImageDecoder::ApplyOrientation(const cv::Mat& pixels, int orientation) -> cv::Mat {
  cv::Mat out;
  switch (orientation) {
    case 2:
      cv::flip(pixels, out, 1);
      break;
    case 3:
      cv::rotate(pixels, out, cv::ROTATE_180);
      break;
    case 4:
      cv::flip(pixels, out, 0);
      break;
    case 5:
      cv::transpose(pixels, out);
      break;
    case 6:
      cv::rotate(pixels, out, cv::ROTATE_90_CLOCKWISE);
      break;
    case 7: {
      cv::Mat transposed;
      cv::transpose(pixels, transposed);
      cv::flip(transposed, out, -1);
      break;
    }
    case 8:
      cv::rotate(pixels, out, cv::ROTATE_90_COUNTERCLOCKWISE);
      break;
    default:
      out = pixels;
      break;
  }
  return out;
}

auto ImageDecoder::Decode(const image_path_t& image_path) -> DecodedImage {
  std::vector<uint8_t> buffer = ReadFileBytes(image_path);

  // IMREAD_UNCHANGED keeps alpha and ignores EXIF orientation, which is applied explicitly below
  cv::Mat              raw;
  try {
    raw = cv::imdecode(cv::Mat(1, static_cast<int>(buffer.size()), CV_8UC1, buffer.data()),
                       cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::string("ImageDecoder: OpenCV: ") + e.what());
  }
  if (raw.empty()) {
    throw std::runtime_error("ImageDecoder: cannot decode " + image_path.filename().string());
  }

  DecodedImage image;
  try {
    image.metadata_ = MetadataExtractor::ExtractFromBuffer(buffer.data(), buffer.size());
  } catch (const std::exception& e) {
    image.metadata_       = MetadataBlock{};
    image.metadata_error_ = e.what();
  }

  image.source_orientation_ = MetadataExtractor::ReadOrientation(image.metadata_);
  cv::Mat bgr               = ToBgr8(raw);
  image.has_alpha_          = bgr.channels() == 4;
  image.pixels_             = ApplyOrientation(bgr, image.source_orientation_);
  return image;
}
};  // namespace photopackager
