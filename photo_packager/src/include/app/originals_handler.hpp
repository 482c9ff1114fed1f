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

#include <optional>

#include "io/fs/file_mutator.hpp"
#include "job/file_outcome.hpp"
#include "job/job_spec.hpp"
#include "job/output_layout.hpp"
#include "scanner/source_scanner.hpp"

namespace photopackager {
/**
 * @brief Applies the job's originals action to one source file, or its RAW action when the
 * source is a camera RAW file. RAW files go to their own folder.
 *
 * MOVE copies first, verifies the copy (size, then XXH3-128 digest when enabled) and deletes the
 * source only after the copy is proven identical. Any failure before that point leaves the source
 * in place and discards the copy.
 */
class OriginalsHandler {
 public:
  OriginalsHandler(const JobSpec& spec, const OutputLayout& layout, FileMutator& mutator)
      : spec_(spec), layout_(layout), mutator_(mutator) {}

  /**
   * @brief Handle one entry.
   *
   * @param entry
   * @return std::nullopt for standard sources under SKIP_EXPORT, where nothing is attempted
   */
  auto Handle(const SourceEntry& entry) const -> std::optional<FileOutcome>;
  // Whether Handle() produces an outcome for this entry
  auto Applies(const SourceEntry& entry) const -> bool;

  auto DestinationFor(const SourceEntry& entry) const -> image_path_t;

 private:
  auto Copy(const SourceEntry& entry) const -> FileOutcome;
  auto Move(const SourceEntry& entry) const -> FileOutcome;
  // Empty string when the copy matches the source
  auto Verify(const image_path_t& source, const image_path_t& copy) const -> std::string;

  const JobSpec&      spec_;
  const OutputLayout& layout_;
  FileMutator&        mutator_;
};
};  // namespace photopackager
