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

namespace photopackager {
static constexpr int kQualityFloor   = 30;
static constexpr int kQualityCeiling = 95;

/**
 * @brief Output dimensions for a compressed derivative.
 *
 * Images at or below the pixel budget keep their size. Larger ones scale by
 * sqrt(target / (w * h)) on both axes, rounded down, so the aspect ratio holds and the product
 * never exceeds the budget. A target of 0 disables resizing.
 *
 * @param width
 * @param height
 * @param target_pixels
 * @return cv::Size
 */
auto ComputeCompressedSize(int width, int height, uint64_t target_pixels) -> cv::Size;

/**
 * @brief Resize with area interpolation when the planned size differs from the input.
 */
auto ResizeForBudget(const cv::Mat& pixels, uint64_t target_pixels) -> cv::Mat;

/**
 * @brief Shift a base quality by luminance contrast. Flat images (stddev < 30) lose 10, busy ones
 * (stddev > 60) gain 5. The result stays in [kQualityFloor, kQualityCeiling].
 */
auto ComputeComplexityQuality(const cv::Mat& pixels, int base_quality) -> int;
};  // namespace photopackager
