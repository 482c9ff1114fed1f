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
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace photopackager {
enum class SourceKind : uint8_t {
  // Standard formats OpenCV can decode into a derivative
  JPEG = 0,
  PNG,
  TIFF,
  WEBP,
  BMP,
  // Recognized image formats that are only handled as originals
  OTHER_IMAGE,
  RAW,
  UNKNOWN
};

// Lowercase, dot-prefixed
static const std::unordered_set<std::string> other_image_extensions = {
    ".gif",  ".avif", ".psd", ".ai",  ".eps", ".svg",  ".heif", ".heic", ".apng",
    ".jp2",  ".j2k",  ".jpf", ".jpx", ".hdr", ".exr",  ".ico",  ".pcx",  ".tga",
    ".xisf", ".pam",  ".sgi", ".fits"};

static const std::unordered_set<std::string> raw_extensions = {
    ".raw", ".arw", ".srf", ".sr2", ".crw", ".cr2", ".cr3", ".nef", ".nrw", ".orf",
    ".rw2", ".raf", ".dng", ".mos", ".kdc", ".dcr", ".x3f", ".pef", ".3fr", ".mef",
    ".erf", ".fff", ".iiq", ".rwl", ".mrw", ".srw", ".gpr", ".k25"};

inline auto LowercaseExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  for (char& c : ext) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return ext;
}

inline auto ClassifyExtension(const fs::path& path) -> SourceKind {
  const std::string ext = LowercaseExtension(path);
  if (ext == ".jpg" || ext == ".jpeg" || ext == ".jpe" || ext == ".jif" || ext == ".jfif" ||
      ext == ".jfi") {
    return SourceKind::JPEG;
  }
  if (ext == ".png") return SourceKind::PNG;
  if (ext == ".tif" || ext == ".tiff") return SourceKind::TIFF;
  if (ext == ".webp") return SourceKind::WEBP;
  if (ext == ".bmp" || ext == ".dib") return SourceKind::BMP;
  if (other_image_extensions.count(ext) > 0) return SourceKind::OTHER_IMAGE;
  if (raw_extensions.count(ext) > 0) return SourceKind::RAW;
  return SourceKind::UNKNOWN;
}

inline bool IsDecodableKind(SourceKind kind) {
  return kind == SourceKind::JPEG || kind == SourceKind::PNG || kind == SourceKind::TIFF ||
         kind == SourceKind::WEBP || kind == SourceKind::BMP;
}

inline bool is_supported_file(const fs::path& path, bool include_raw) {
  const SourceKind kind = ClassifyExtension(path);
  if (kind == SourceKind::UNKNOWN) return false;
  if (kind == SourceKind::RAW) return include_raw;
  return true;
}

inline auto SourceKindName(SourceKind kind) -> const char* {
  switch (kind) {
    case SourceKind::JPEG:
      return "jpeg";
    case SourceKind::PNG:
      return "png";
    case SourceKind::TIFF:
      return "tiff";
    case SourceKind::WEBP:
      return "webp";
    case SourceKind::BMP:
      return "bmp";
    case SourceKind::OTHER_IMAGE:
      return "other";
    case SourceKind::RAW:
      return "raw";
    default:
      return "unknown";
  }
}
};  // namespace photopackager
