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

#include "io/fs/file_mutator.hpp"
#include "job/file_outcome.hpp"
#include "job/output_layout.hpp"

namespace photopackager {
struct ArchiveOutcome {
  ArchiveTarget target_{};
  OutcomeStatus status_  = OutcomeStatus::SUCCESS;
  std::string   reason_{};
  size_t        entries_ = 0;
};

/**
 * @brief Bundles each populated top-level delivery folder into a deflate zip at the job root.
 *
 * Entry names are relative to the folder being archived. A failed archive is removed and does
 * not stop the others.
 */
class Archiver {
 public:
  explicit Archiver(FileMutator& mutator) : mutator_(mutator) {}

  /**
   * @brief Archive every planned target.
   *
   * @param planned targets that received at least one file during the run
   * @return one outcome per planned target
   */
  auto        ArchiveAll(const std::vector<ArchiveTarget>& planned) const
      -> std::vector<ArchiveOutcome>;

  /**
   * @brief Write a zip of folder to zip_path.
   *
   * @return number of entries written
   * @throws std::runtime_error on any libzip failure
   */
  static auto WriteZip(const file_path_t& folder, const file_path_t& zip_path) -> size_t;

  /**
   * @brief Entry names of an existing zip, in archive order.
   *
   * @throws std::runtime_error if the archive cannot be opened
   */
  static auto ListEntries(const file_path_t& zip_path) -> std::vector<std::string>;

 private:
  FileMutator& mutator_;
};
};  // namespace photopackager
