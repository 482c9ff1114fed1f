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

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>


namespace photopackager {
class PackageTestFixture : public ::testing::Test {
 protected:
  std::filesystem::path work_dir_;
  std::filesystem::path source_dir_;
  std::filesystem::path output_parent_;

  void                  SetUp() override {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);

    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    work_dir_        = std::filesystem::temp_directory_path() /
                (std::string("photopackager_") + info->test_suite_name() + "_" + info->name());
    std::error_code ec;
    std::filesystem::remove_all(work_dir_, ec);
    source_dir_    = work_dir_ / "source";
    output_parent_ = work_dir_ / "delivery";
    std::filesystem::create_directories(source_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(work_dir_, ec);
  }

  // Smooth gradient, low luminance contrast
  static auto MakeGradient(int width, int height) -> cv::Mat {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        image.at<cv::Vec3b>(y, x) =
            cv::Vec3b(static_cast<uint8_t>(100 + (x * 40) / std::max(1, width)),
                      static_cast<uint8_t>(110 + (y * 30) / std::max(1, height)), 120);
      }
    }
    return image;
  }

  // Uniform noise, hard to compress
  static auto MakeNoise(int width, int height, int channels = 3, uint64_t seed = 42) -> cv::Mat {
    cv::Mat image(height, width, CV_8UC(channels));
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, 0, 256);
    return image;
  }

  static auto WriteImage(const std::filesystem::path& path, const cv::Mat& image,
                         const std::vector<int>& params = {}) -> std::filesystem::path {
    std::filesystem::create_directories(path.parent_path());
    if (!cv::imwrite(path.string(), image, params)) {
      throw std::runtime_error("test fixture: cannot write " + path.string());
    }
    return path;
  }

  static void WriteTags(const std::filesystem::path&              path,
                        const std::map<std::string, std::string>& ascii_tags,
                        int                                       orientation = 0) {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::ExifData& exif = image->exifData();
    for (const auto& [key, value] : ascii_tags) {
      exif[key] = std::string(value);
    }
    if (orientation > 0) {
      exif["Exif.Image.Orientation"] = static_cast<uint16_t>(orientation);
    }
    image->writeMetadata();
  }

  static auto ReadExif(const std::filesystem::path& path) -> Exiv2::ExifData {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    return image->exifData();
  }

  static auto HasKey(const Exiv2::ExifData& exif, const std::string& key) -> bool {
    return exif.findKey(Exiv2::ExifKey(key)) != exif.end();
  }

  static auto ReadBytes(const std::filesystem::path& path) -> std::vector<char> {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>());
  }

  static void WriteBytes(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
  }

  // Relative paths of everything under root, directories included
  static auto Tree(const std::filesystem::path& root) -> std::vector<std::string> {
    std::vector<std::string> paths;
    std::error_code          ec;
    if (!std::filesystem::exists(root, ec)) return paths;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
      paths.push_back(entry.path().lexically_relative(root).generic_string());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
  }
};
}  // namespace photopackager
