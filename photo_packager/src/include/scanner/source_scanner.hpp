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

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace photopackager {
/**
 * @brief One discovered image. Immutable after the scan.
 *
 * The sequence number is the only input to output naming in every category.
 */
struct SourceEntry {
  image_path_t  path_{};
  sequence_id_t sequence_ = 0;
  SourceKind    kind_     = SourceKind::UNKNOWN;
  bool          readable_ = true;
  // Why the entry was skipped, empty for readable entries
  std::string   skip_reason_{};
  byte_size_t   size_ = 0;
};

struct ScanOptions {
  bool                      recursive_   = false;
  bool                      include_raw_ = true;
  // Directory trees never scanned, normally the job's generated output folders
  std::vector<image_path_t> exclude_{};
};

struct ScanResult {
  // Readable entries with sequences 1..N in name order
  std::vector<SourceEntry> entries_{};
  // Unreadable files and directories, sequence 0
  std::vector<SourceEntry> skipped_{};
};

/**
 * @brief Contents of one directory level as far as they could be read.
 */
struct DirectoryListing {
  std::vector<std::filesystem::directory_entry> entries_{};
  // False when the directory could not be opened at all
  bool                                          opened_ = true;
  // Set when opening failed or the listing stopped early
  std::error_code                               error_{};
};

class DirectoryReader {
 public:
  virtual ~DirectoryReader()                                        = default;
  virtual auto List(const image_path_t& dir) const -> DirectoryListing = 0;
};

class DirectoryReaderImpl : public DirectoryReader {
 public:
  auto List(const image_path_t& dir) const -> DirectoryListing override;
};

class SourceScanner {
 public:
  /**
   * @brief Enumerate supported images under a directory in a deterministic order.
   *
   * Entries sort by file name ignoring case, then by raw bytes, then by full path.
   *
   * @param source_dir
   * @param options
   * @return ScanResult
   * @throws JobSetupError if source_dir is missing or not a directory
   */
  static auto Scan(const image_path_t& source_dir, const ScanOptions& options = {}) -> ScanResult;

  /**
   * @brief Same as Scan() but lists directories through the given reader.
   *
   * A subdirectory that cannot be opened, or whose listing fails part way, becomes a skipped
   * entry carrying the error and the walk continues with its siblings.
   */
  static auto Scan(const image_path_t& source_dir, const ScanOptions& options,
                   const DirectoryReader& reader) -> ScanResult;

  static auto NameOrderLess(const image_path_t& lhs, const image_path_t& rhs) -> bool;
};
};  // namespace photopackager
