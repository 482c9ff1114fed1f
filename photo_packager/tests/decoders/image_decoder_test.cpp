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

#include <gtest/gtest.h>

#include <stdexcept>

#include "package_test_fixation.hpp"

namespace photopackager {
class ImageDecoderTests : public PackageTestFixture {};

TEST_F(ImageDecoderTests, DecodesJpegToEightBitBgr) {
  const auto   path    = WriteImage(source_dir_ / "plain.jpg", MakeGradient(120, 80));
  DecodedImage decoded = ImageDecoder::Decode(path);
  EXPECT_EQ(decoded.pixels_.cols, 120);
  EXPECT_EQ(decoded.pixels_.rows, 80);
  EXPECT_EQ(decoded.pixels_.type(), CV_8UC3);
  EXPECT_EQ(decoded.source_orientation_, 1);
  EXPECT_FALSE(decoded.has_alpha_);
}

TEST_F(ImageDecoderTests, RotatesByExifOrientation) {
  const auto path = WriteImage(source_dir_ / "portrait.jpg", MakeGradient(120, 80));
  WriteTags(path, {}, 6);

  DecodedImage decoded = ImageDecoder::Decode(path);
  EXPECT_EQ(decoded.source_orientation_, 6);
  EXPECT_EQ(decoded.pixels_.cols, 80);
  EXPECT_EQ(decoded.pixels_.rows, 120);
}

TEST_F(ImageDecoderTests, OrientationTableMatchesExif) {
  // 2x3 image with distinct values so every transform is observable
  cv::Mat src = (cv::Mat_<uint8_t>(2, 3) << 1, 2, 3, 4, 5, 6);

  cv::Mat o2  = ImageDecoder::ApplyOrientation(src, 2);
  EXPECT_EQ(o2.at<uint8_t>(0, 0), 3);

  cv::Mat o3  = ImageDecoder::ApplyOrientation(src, 3);
  EXPECT_EQ(o3.at<uint8_t>(0, 0), 6);

  cv::Mat o4  = ImageDecoder::ApplyOrientation(src, 4);
  EXPECT_EQ(o4.at<uint8_t>(0, 0), 4);

  cv::Mat o5  = ImageDecoder::ApplyOrientation(src, 5);
  ASSERT_EQ(o5.size(), cv::Size(2, 3));
  EXPECT_EQ(o5.at<uint8_t>(0, 1), 4);

  cv::Mat o6  = ImageDecoder::ApplyOrientation(src, 6);
  ASSERT_EQ(o6.size(), cv::Size(2, 3));
  EXPECT_EQ(o6.at<uint8_t>(0, 0), 4);
  EXPECT_EQ(o6.at<uint8_t>(0, 1), 1);

  cv::Mat o7  = ImageDecoder::ApplyOrientation(src, 7);
  ASSERT_EQ(o7.size(), cv::Size(2, 3));
  EXPECT_EQ(o7.at<uint8_t>(0, 0), 6);

  cv::Mat o8  = ImageDecoder::ApplyOrientation(src, 8);
  ASSERT_EQ(o8.size(), cv::Size(2, 3));
  EXPECT_EQ(o8.at<uint8_t>(0, 0), 3);

  cv::Mat o1  = ImageDecoder::ApplyOrientation(src, 1);
  EXPECT_EQ(cv::countNonZero(o1 != src), 0);
}

TEST_F(ImageDecoderTests, KeepsAlphaFromPng) {
  const auto   path    = WriteImage(source_dir_ / "alpha.png", MakeNoise(40, 30, 4));
  DecodedImage decoded = ImageDecoder::Decode(path);
  EXPECT_TRUE(decoded.has_alpha_);
  EXPECT_EQ(decoded.pixels_.type(), CV_8UC4);
}

TEST_F(ImageDecoderTests, NormalizesSixteenBitAndGray) {
  cv::Mat deep(20, 10, CV_16UC3, cv::Scalar(65535, 32896, 0));
  const auto   deep_path = WriteImage(source_dir_ / "deep.png", deep);
  DecodedImage decoded   = ImageDecoder::Decode(deep_path);
  EXPECT_EQ(decoded.pixels_.type(), CV_8UC3);
  EXPECT_EQ(decoded.pixels_.at<cv::Vec3b>(0, 0)[0], 255);

  cv::Mat      gray(20, 10, CV_8UC1, cv::Scalar(77));
  const auto   gray_path = WriteImage(source_dir_ / "gray.png", gray);
  DecodedImage gray_img  = ImageDecoder::Decode(gray_path);
  EXPECT_EQ(gray_img.pixels_.type(), CV_8UC3);
  EXPECT_EQ(gray_img.pixels_.at<cv::Vec3b>(5, 5)[2], 77);
}

TEST_F(ImageDecoderTests, CorruptFileThrows) {
  WriteBytes(source_dir_ / "broken.jpg", "definitely not a jpeg");
  EXPECT_THROW(ImageDecoder::Decode(source_dir_ / "broken.jpg"), std::runtime_error);
  EXPECT_THROW(ImageDecoder::Decode(source_dir_ / "absent.jpg"), std::runtime_error);
}
}  // namespace photopackager
