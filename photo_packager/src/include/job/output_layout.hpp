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

#include <cstddef>
#include <string>
#include <vector>

#include "job/job_spec.hpp"
#include "type/type.hpp"

namespace photopackager {
/**
 * @brief A top-level delivery folder and the archive built from it.
 */
struct ArchiveTarget {
  image_path_t folder_{};
  image_path_t archive_path_{};
};

/**
 * @brief Destination paths and file names of one job, resolved once from the JobSpec.
 *
 * Layout: <output_parent>/<shoot_base_name>/{originals, raw, optimized/{jpg, webp},
 * compressed/{jpg, webp}}. File names are <prefix?><sequence>-<shoot_base_name><ext>, with the
 * sequence zero-padded to max(3, digits(total_sources)).
 */
class OutputLayout {
 public:
  OutputLayout() = default;
  static auto Resolve(const JobSpec& spec, size_t total_sources) -> OutputLayout;

  auto        Root() const -> const image_path_t& { return root_; }
  auto        CategoryDir(OutputCategory category) const -> image_path_t;
  auto        TopLevelDir(OutputCategory category) const -> image_path_t;

  auto        FileName(OutputCategory category, sequence_id_t sequence,
                       const std::string& extension, bool is_raw = false) const -> std::string;
  auto        OutputPath(OutputCategory category, sequence_id_t sequence,
                         const std::string& extension, bool is_raw = false) const -> image_path_t;

  // Camera RAW sources, named like originals with the RAW_ prefix
  auto        RawDir() const -> image_path_t { return root_ / folders_.raw_; }
  auto        RawPath(sequence_id_t sequence, const std::string& extension) const -> image_path_t;
  auto        RawReadme() const -> image_path_t { return RawDir() / folders_.raw_readme_; }
  // Top-level folders the job writes into, never scanned as sources
  auto        GeneratedDirs() const -> std::vector<image_path_t>;

  auto        LogFile() const -> image_path_t { return root_ / folders_.log_file_; }
  auto        Readme() const -> image_path_t { return root_ / folders_.readme_; }

  auto        ArchiveTargets() const -> std::vector<ArchiveTarget>;
  auto        Folders() const -> const FolderNames& { return folders_; }
  auto        SequenceWidth() const -> size_t { return sequence_width_; }

 private:
  image_path_t root_{};
  FolderNames  folders_{};
  std::string  base_name_{};
  size_t       sequence_width_ = 3;
  bool         add_prefix_     = false;
};

auto FormatSequence(sequence_id_t sequence, size_t width) -> std::string;
};  // namespace photopackager
