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
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "type/type.hpp"

namespace photopackager {
/**
 * @brief The single gate for every filesystem mutation a job performs.
 *
 * In dry-run mode each call reports what it would have done through the notice callback and
 * returns as if it succeeded, so callers run the exact same control flow. Live failures throw
 * std::filesystem::filesystem_error or std::runtime_error.
 */
class FileMutator {
 public:
  using NoticeCallback = std::function<void(const std::string&)>;
  // Receives the temporary path the archive must be written to
  using ArchiveBuilder = std::function<void(const file_path_t&)>;

  virtual ~FileMutator() = default;

  virtual auto IsDryRun() const -> bool                                                   = 0;
  virtual void SetNoticeCallback(NoticeCallback on_notice)                                = 0;

  virtual void CreateDirectories(const file_path_t& dir)                                  = 0;
  // Writes to a sibling ".part" file first, then renames over dest
  virtual void WriteBytes(const file_path_t& dest, const std::vector<uint8_t>& bytes)     = 0;
  virtual void WriteText(const file_path_t& dest, const std::string& text)                = 0;
  // Byte-for-byte copy that keeps the source modification time
  virtual void CopyFile(const file_path_t& src, const file_path_t& dest)                  = 0;
  virtual void RemoveFile(const file_path_t& path)                                        = 0;
  virtual void CreateArchive(const file_path_t& archive_path, const ArchiveBuilder& build) = 0;
};

class FileMutatorImpl : public FileMutator {
 public:
  FileMutatorImpl() = default;
  FileMutatorImpl(bool dry_run, NoticeCallback on_notice)
      : dry_run_(dry_run), on_notice_(std::move(on_notice)) {}

  auto IsDryRun() const -> bool override { return dry_run_; }
  void SetNoticeCallback(NoticeCallback on_notice) override { on_notice_ = std::move(on_notice); }

  void CreateDirectories(const file_path_t& dir) override;
  void WriteBytes(const file_path_t& dest, const std::vector<uint8_t>& bytes) override;
  void WriteText(const file_path_t& dest, const std::string& text) override;
  void CopyFile(const file_path_t& src, const file_path_t& dest) override;
  void RemoveFile(const file_path_t& path) override;
  void CreateArchive(const file_path_t& archive_path, const ArchiveBuilder& build) override;

 private:
  void           Notice(const std::string& message) const;

  bool           dry_run_ = false;
  NoticeCallback on_notice_{};
};

auto PartPath(const file_path_t& dest) -> file_path_t;
};  // namespace photopackager
