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

#include "derivative/resize_planner.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace photopackager {
auto ComputeCompressedSize(int width, int height, uint64_t target_pixels) -> cv::Size {
  if (width <= 0 || height <= 0 || target_pixels == 0) {
    return cv::Size(width, height);
  }
  const uint64_t pixels = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
  if (pixels <= target_pixels) {
    return cv::Size(width, height);
  }

  const double scale =
      std::sqrt(static_cast<double>(target_pixels) / static_cast<double>(pixels));
  int64_t dst_w = std::max<int64_t>(1, static_cast<int64_t>(std::floor(width * scale)));
  int64_t dst_h = std::max<int64_t>(1, static_cast<int64_t>(std::floor(height * scale)));

  // Floating point can land one pixel over the budget
  while (static_cast<uint64_t>(dst_w * dst_h) > target_pixels && (dst_w > 1 || dst_h > 1)) {
    if (dst_w >= dst_h) {
      --dst_w;
    } else {
      --dst_h;
    }
  }
  return cv::Size(static_cast<int>(dst_w), static_cast<int>(dst_h));
}

auto ResizeForBudget(const cv::Mat& pixels, uint64_t target_pixels) -> cv::Mat {
  const cv::Size planned = ComputeCompressedSize(pixels.cols, pixels.rows, target_pixels);
  if (planned.width == pixels.cols && planned.height == pixels.rows) {
    return pixels;
  }
  cv::Mat resized;
  cv::resize(pixels, resized, planned, 0.0, 0.0, cv::INTER_AREA);
  return resized;
}

auto ComputeComplexityQuality(const cv::Mat& pixels, int base_quality) -> int {
  int quality = base_quality;
  if (!pixels.empty()) {
    cv::Mat gray;
    switch (pixels.channels()) {
      case 1:
        gray = pixels;
        break;
      case 4:
        cv::cvtColor(pixels, gray, cv::COLOR_BGRA2GRAY);
        break;
      default:
        cv::cvtColor(pixels, gray, cv::COLOR_BGR2GRAY);
        break;
    }
    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(gray, mean, stddev);
    if (stddev[0] < 30.0) {
      quality -= 10;
    } else if (stddev[0] > 60.0) {
      quality += 5;
    }
  }
  return std::clamp(quality, kQualityFloor, kQualityCeiling);
}
};  // namespace photopackager
