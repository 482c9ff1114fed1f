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

#include "job/output_layout.hpp"

#include <algorithm>
#include <string>

namespace photopackager {
auto FormatSequence(sequence_id_t sequence, size_t width) -> std::string {
  std::string digits = std::to_string(sequence);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return digits;
}

auto OutputLayout::Resolve(const JobSpec& spec, size_t total_sources) -> OutputLayout {
  OutputLayout layout;
  layout.root_           = spec.output_parent_ / spec.shoot_base_name_;
  layout.folders_        = spec.folders_;
  layout.base_name_      = spec.shoot_base_name_;
  layout.add_prefix_     = spec.add_prefix_;
  layout.sequence_width_ = std::max<size_t>(3, std::to_string(total_sources).size());
  return layout;
}

auto OutputLayout::TopLevelDir(OutputCategory category) const -> image_path_t {
  switch (category) {
    case OutputCategory::ORIGINAL:
      return root_ / folders_.originals_;
    case OutputCategory::OPTIMIZED_JPEG:
    case OutputCategory::OPTIMIZED_WEBP:
      return root_ / folders_.optimized_root_;
    case OutputCategory::COMPRESSED_JPEG:
    case OutputCategory::COMPRESSED_WEBP:
      return root_ / folders_.compressed_root_;
  }
  return root_;
}

auto OutputLayout::CategoryDir(OutputCategory category) const -> image_path_t {
  switch (category) {
    case OutputCategory::ORIGINAL:
      return root_ / folders_.originals_;
    case OutputCategory::OPTIMIZED_JPEG:
      return root_ / folders_.optimized_root_ / folders_.optimized_jpg_;
    case OutputCategory::OPTIMIZED_WEBP:
      return root_ / folders_.optimized_root_ / folders_.optimized_webp_;
    case OutputCategory::COMPRESSED_JPEG:
      return root_ / folders_.compressed_root_ / folders_.compressed_jpg_;
    case OutputCategory::COMPRESSED_WEBP:
      return root_ / folders_.compressed_root_ / folders_.compressed_webp_;
  }
  return root_;
}

auto OutputLayout::FileName(OutputCategory category, sequence_id_t sequence,
                            const std::string& extension, bool is_raw) const -> std::string {
  std::string name;
  if (add_prefix_) {
    if (category == OutputCategory::ORIGINAL) {
      name = is_raw ? "RAW_" : "Original_";
    } else if (IsCompressedCategory(category)) {
      name = "Compressed_";
    } else {
      name = "Optimized_";
    }
  }
  name += FormatSequence(sequence, sequence_width_);
  name += "-";
  name += base_name_;
  name += extension;
  return name;
}

auto OutputLayout::OutputPath(OutputCategory category, sequence_id_t sequence,
                              const std::string& extension, bool is_raw) const -> image_path_t {
  return CategoryDir(category) / FileName(category, sequence, extension, is_raw);
}

auto OutputLayout::RawPath(sequence_id_t sequence, const std::string& extension) const
    -> image_path_t {
  return RawDir() / FileName(OutputCategory::ORIGINAL, sequence, extension, true);
}

auto OutputLayout::GeneratedDirs() const -> std::vector<image_path_t> {
  return {root_ / folders_.originals_, RawDir(), root_ / folders_.optimized_root_,
          root_ / folders_.compressed_root_};
}

auto OutputLayout::ArchiveTargets() const -> std::vector<ArchiveTarget> {
  std::vector<ArchiveTarget> targets;
  for (const auto& folder : GeneratedDirs()) {
    targets.push_back({folder, root_ / (folder.filename().string() + ".zip")});
  }
  return targets;
}
};  // namespace photopackager
