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

#include "report/delivery_readme.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

#include "utils/clock/time_provider.hpp"

namespace photopackager {
namespace {
auto OrDefault(const std::string& value, const char* fallback) -> std::string {
  return value.empty() ? std::string(fallback) : value;
}

auto Megapixels(uint64_t pixels) -> std::string {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << static_cast<double>(pixels) / 1e6;
  return oss.str();
}
}  // namespace

auto BuildDeliveryReadme(const JobSpec& spec, const OutputLayout& layout,
                         std::chrono::system_clock::time_point prepared, bool has_raw)
    -> std::string {
  const FolderNames& folders = layout.Folders();
  const std::string  company = OrDefault(spec.branding_.company_name_, "your photographer");

  std::ostringstream out;
  out << "DIGITAL DELIVERY README\n";
  out << "===========================================\n\n";
  out << "Thank you for opening your digital delivery from " << company << "!\n";
  out << "Project: " << spec.shoot_base_name_ << "\n";
  out << "Prepared: " << TimeProvider::TimePointToString(prepared, "%Y-%m-%d") << "\n\n";
  out << "Folder Structure Explained:\n";
  out << "---------------------------\n";

  int section = 1;
  if (spec.originals_action_ == OriginalsAction::COPY ||
      spec.originals_action_ == OriginalsAction::MOVE) {
    out << section++ << ".  " << folders.originals_ << "/\n";
    out << "    Full-resolution source files, unchanged.\n\n";
  }

  if (has_raw && spec.DeliversRaw()) {
    out << section++ << ".  " << folders.raw_ << "/\n";
    out << "    Camera RAW files exactly as the camera recorded them.\n";
    out << "    See the " << folders.raw_readme_ << " inside that folder before opening them.\n\n";
  }

  const bool opt_jpg  = spec.IsEnabled(OutputCategory::OPTIMIZED_JPEG);
  const bool opt_webp = spec.IsEnabled(OutputCategory::OPTIMIZED_WEBP);
  if (opt_jpg || opt_webp) {
    out << section++ << ".  " << folders.optimized_root_ << "/\n";
    if (opt_jpg) {
      out << "    " << folders.optimized_jpg_
          << "/: full-size high-quality JPGs for print and digital use (quality "
          << spec.optimized_jpeg_.quality_ << "/100).\n";
    }
    if (opt_webp) {
      out << "    " << folders.optimized_webp_
          << "/: full-size high-quality WebP images, smaller than JPG at similar quality (quality "
          << spec.optimized_webp_.quality_ << "/100).\n";
    }
    out << "\n";
  }

  const bool cmp_jpg  = spec.IsEnabled(OutputCategory::COMPRESSED_JPEG);
  const bool cmp_webp = spec.IsEnabled(OutputCategory::COMPRESSED_WEBP);
  if (cmp_jpg || cmp_webp) {
    out << section++ << ".  " << folders.compressed_root_ << "/\n";
    if (cmp_jpg) {
      out << "    " << folders.compressed_jpg_ << "/: JPGs resized to about "
          << Megapixels(spec.compressed_jpeg_.target_pixels_)
          << " megapixels for sharing, social media and email.\n";
    }
    if (cmp_webp) {
      out << "    " << folders.compressed_webp_ << "/: WebP images resized to about "
          << Megapixels(spec.compressed_webp_.target_pixels_)
          << " megapixels, the smallest files in this delivery.\n";
    }
    out << "\n";
  }

  if (spec.archive_) {
    out << "ZIP Archives:\n";
    out << "---------------------------\n";
    out << "Each folder above may also be provided as a .zip archive in this folder.\n";
    out << "Windows: right-click the .zip file and choose \"Extract All...\".\n";
    out << "macOS: double-click the .zip file.\n\n";
  }

  out << "Need Help with These Files?\n";
  out << "---------------------------\n";
  out << "Please contact " << company << ":\n\n";
  out << "* Website: " << OrDefault(spec.branding_.website_, "n/a") << "\n";
  out << "* Support: " << OrDefault(spec.branding_.support_email_, "n/a") << "\n\n";
  out << "Thank you!\n";
  return out.str();
}

auto BuildRawReadme() -> std::string {
  std::ostringstream out;
  out << "RAW FILES\n";
  out << "===========================================\n\n";
  out << "This folder contains the original camera RAW files from your photo shoot.\n";
  out << "These files:\n\n";
  out << "- Are in their original camera RAW format\n";
  out << "- Have not been processed or modified\n";
  out << "- May require specialized software to open (e.g., Adobe Lightroom, Capture One)\n";
  out << "- Provide maximum flexibility for professional editing\n\n";
  out << "For easy viewing and sharing, please use the processed JPG/WebP files in the\n";
  out << "other folders, which have been optimized for general use.\n";
  return out.str();
}
};  // namespace photopackager
