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

#include "image/metadata_policy.hpp"

#include <exiv2/exiv2.hpp>
#include <string>
#include <unordered_set>

namespace photopackager {
namespace {
const std::unordered_set<std::string> kDateKeys = {
    "Exif.Image.DateTime",
    "Exif.Image.DateTimeOriginal",
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Photo.OffsetTime",
    "Exif.Photo.OffsetTimeOriginal",
    "Exif.Photo.OffsetTimeDigitized",
    "Exif.Photo.SubSecTime",
    "Exif.Photo.SubSecTimeOriginal",
    "Exif.Photo.SubSecTimeDigitized",
    "Exif.GPSInfo.GPSDateStamp",
    "Exif.GPSInfo.GPSTimeStamp",
    "Xmp.xmp.CreateDate",
    "Xmp.xmp.ModifyDate",
    "Xmp.xmp.MetadataDate",
    "Xmp.photoshop.DateCreated",
    "Xmp.exif.DateTimeOriginal",
    "Xmp.exif.DateTimeDigitized",
    "Xmp.tiff.DateTime",
    "Iptc.Application2.DateCreated",
    "Iptc.Application2.TimeCreated",
    "Iptc.Application2.DigitizationDate",
    "Iptc.Application2.DigitizationTime",
    "Iptc.Envelope.DateSent",
    "Iptc.Envelope.TimeSent"};

const std::unordered_set<std::string> kCameraKeys = {
    "Exif.Image.Make",
    "Exif.Image.Model",
    "Exif.Image.Software",
    "Exif.Image.UniqueCameraModel",
    "Exif.Image.LocalizedCameraModel",
    "Exif.Image.CameraSerialNumber",
    "Exif.Image.LensInfo",
    "Exif.Photo.MakerNote",
    "Exif.Photo.CameraOwnerName",
    "Exif.Photo.BodySerialNumber",
    "Exif.Photo.LensSpecification",
    "Exif.Photo.LensMake",
    "Exif.Photo.LensModel",
    "Exif.Photo.LensSerialNumber",
    "Xmp.tiff.Make",
    "Xmp.tiff.Model",
    "Xmp.tiff.Software",
    "Xmp.xmp.CreatorTool",
    "Xmp.exifEX.LensMake",
    "Xmp.exifEX.LensModel",
    "Xmp.exifEX.LensSpecification",
    "Xmp.exifEX.LensSerialNumber",
    "Xmp.exifEX.BodySerialNumber",
    "Xmp.exifEX.CameraOwnerName"};

template <typename Container, typename Predicate>
auto EraseIf(Container& container, Predicate pred) -> size_t {
  size_t removed = 0;
  for (auto it = container.begin(); it != container.end();) {
    if (pred(*it)) {
      it = container.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}
}  // namespace

auto MetadataCapabilities::Detect() -> MetadataCapabilities {
  MetadataCapabilities caps;
  // Per-tag erase with intact IFD rewriting is reliable from 0.27 on
  caps.selective_strip_ = Exiv2::versionNumber() >= EXIV2_MAKE_VERSION(0, 27, 0);
  return caps;
}

auto MetadataPolicyEngine::IsDateKey(const std::string& key) -> bool {
  return kDateKeys.count(key) > 0;
}

auto MetadataPolicyEngine::IsCameraKey(const std::string& key, const std::string& group) -> bool {
  if (kCameraKeys.count(key) > 0) return true;
  // Vendor maker note IFDs (Canon, Nikon3, Sony1, ...) and the MakerNote bookkeeping group
  if (group == "MakerNote" || Exiv2::ExifTags::isMakerGroup(group)) return true;
  return key.rfind("Xmp.aux.", 0) == 0;
}

auto MetadataPolicyEngine::Apply(const MetadataBlock& source, MetadataPolicy policy) const
    -> PolicyResult {
  PolicyResult result;
  result.effective_ = policy;

  if (policy == MetadataPolicy::KEEP) {
    result.block_ = source;
    return result;
  }

  const bool selective = policy != MetadataPolicy::STRIP_ALL;
  if (selective && !capabilities_.selective_strip_) {
    result.effective_ = MetadataPolicy::STRIP_ALL;
    result.fell_back_ = true;
    result.warning_   = std::string("selective metadata removal unavailable; policy '") +
                      MetadataPolicyName(policy) + "' fell back to strip-all";
  }

  if (result.effective_ == MetadataPolicy::STRIP_ALL) {
    result.removed_tags_ = source.TagCount();
    return result;
  }

  const bool strip_date   = policy == MetadataPolicy::STRIP_DATE ||
                          policy == MetadataPolicy::STRIP_DATE_AND_CAMERA;
  const bool strip_camera = policy == MetadataPolicy::STRIP_CAMERA ||
                            policy == MetadataPolicy::STRIP_DATE_AND_CAMERA;

  result.block_ = source;
  result.removed_tags_ += EraseIf(result.block_.exif_, [&](const Exiv2::Exifdatum& datum) {
    const std::string key = datum.key();
    return (strip_date && IsDateKey(key)) || (strip_camera && IsCameraKey(key, datum.groupName()));
  });
  result.removed_tags_ += EraseIf(result.block_.xmp_, [&](const Exiv2::Xmpdatum& datum) {
    const std::string key = datum.key();
    return (strip_date && IsDateKey(key)) || (strip_camera && IsCameraKey(key, datum.groupName()));
  });
  result.removed_tags_ += EraseIf(result.block_.iptc_, [&](const Exiv2::Iptcdatum& datum) {
    const std::string key = datum.key();
    return (strip_date && IsDateKey(key)) || (strip_camera && IsCameraKey(key, datum.groupName()));
  });
  return result;
}
};  // namespace photopackager
