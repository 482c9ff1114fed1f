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

#include "scanner/source_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "job/job_error.hpp"

namespace photopackager {
namespace {
auto ToLower(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto IsUnder(const fs::path& path, const fs::path& root) -> bool {
  if (root.empty()) return false;
  auto rel = path.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}

auto Normalize(const fs::path& path) -> fs::path {
  std::error_code ec;
  auto            canonical = fs::weakly_canonical(path, ec);
  return ec ? path.lexically_normal() : canonical;
}

void Inspect(const fs::directory_entry& entry, const ScanOptions& options,
             std::vector<SourceEntry>& out) {
  const fs::path& path = entry.path();
  if (!is_supported_file(path, options.include_raw_)) return;

  std::error_code ec;
  SourceEntry     source;
  source.path_ = path;
  source.kind_ = ClassifyExtension(path);

  if (entry.is_symlink(ec) && !fs::exists(path, ec)) {
    source.readable_    = false;
    source.skip_reason_ = "broken symbolic link";
    out.push_back(std::move(source));
    return;
  }
  if (!entry.is_regular_file(ec) || ec) {
    // Directories named like images, sockets, etc.
    return;
  }

  std::ifstream readable(path, std::ios::binary);
  if (!readable.is_open()) {
    source.readable_    = false;
    source.skip_reason_ = "cannot open for reading (permission denied?)";
    out.push_back(std::move(source));
    return;
  }
  source.size_ = entry.file_size(ec);
  if (ec) {
    source.readable_    = false;
    source.skip_reason_ = "cannot stat: " + ec.message();
  }
  out.push_back(std::move(source));
}
}  // namespace

auto SourceScanner::NameOrderLess(const image_path_t& lhs, const image_path_t& rhs) -> bool {
  const std::string l_name = lhs.filename().string();
  const std::string r_name = rhs.filename().string();
  const std::string l_fold = ToLower(l_name);
  const std::string r_fold = ToLower(r_name);
  if (l_fold != r_fold) return l_fold < r_fold;
  if (l_name != r_name) return l_name < r_name;
  return lhs.string() < rhs.string();
}

auto DirectoryReaderImpl::List(const image_path_t& dir) const -> DirectoryListing {
  DirectoryListing       listing;
  std::error_code        ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    listing.opened_ = false;
    listing.error_  = ec;
    return listing;
  }
  fs::directory_iterator end;
  while (it != end) {
    listing.entries_.push_back(*it);
    it.increment(ec);
    if (ec) {
      listing.error_ = ec;
      break;
    }
  }
  return listing;
}

auto SourceScanner::Scan(const image_path_t& source_dir, const ScanOptions& options)
    -> ScanResult {
  const DirectoryReaderImpl reader;
  return Scan(source_dir, options, reader);
}

auto SourceScanner::Scan(const image_path_t& source_dir, const ScanOptions& options,
                         const DirectoryReader& reader) -> ScanResult {
  std::error_code ec;
  if (!fs::exists(source_dir, ec)) {
    throw JobSetupError(JobErrorCode::SOURCE_MISSING,
                        "Source directory does not exist: " + source_dir.string());
  }
  if (!fs::is_directory(source_dir, ec)) {
    throw JobSetupError(JobErrorCode::SOURCE_NOT_DIRECTORY,
                        "Source path is not a directory: " + source_dir.string());
  }

  std::vector<fs::path> excludes;
  for (const auto& path : options.exclude_) {
    if (!path.empty()) excludes.push_back(Normalize(path));
  }
  auto is_excluded = [&excludes](const fs::path& path) {
    const fs::path normalized = Normalize(path);
    return std::any_of(excludes.begin(), excludes.end(),
                       [&normalized](const fs::path& root) { return IsUnder(normalized, root); });
  };

  std::vector<SourceEntry> found;
  auto                     record_dir_failure = [&found](const fs::path& dir, std::string reason) {
    SourceEntry failed;
    failed.path_        = dir;
    failed.readable_    = false;
    failed.skip_reason_ = std::move(reason);
    found.push_back(std::move(failed));
  };

  // Directories are walked one level at a time so a failure only costs that directory
  std::deque<fs::path> pending{source_dir};
  while (!pending.empty()) {
    const fs::path dir = std::move(pending.front());
    pending.pop_front();

    DirectoryListing listing = reader.List(dir);
    if (!listing.opened_) {
      if (dir == source_dir) {
        throw JobSetupError(JobErrorCode::SOURCE_UNREADABLE,
                            "Cannot read source directory " + source_dir.string() + ": " +
                                listing.error_.message());
      }
      record_dir_failure(dir, "cannot read directory: " + listing.error_.message());
      continue;
    }
    if (listing.error_) {
      record_dir_failure(dir, "directory listing interrupted: " + listing.error_.message());
    }

    for (const auto& entry : listing.entries_) {
      std::error_code entry_ec;
      const bool      is_dir = entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec);
      if (is_dir) {
        if (options.recursive_ && !is_excluded(entry.path())) {
          pending.push_back(entry.path());
        }
        continue;
      }
      if (!excludes.empty() && is_excluded(entry.path())) continue;
      Inspect(entry, options, found);
    }
  }

  std::sort(found.begin(), found.end(), [](const SourceEntry& a, const SourceEntry& b) {
    return NameOrderLess(a.path_, b.path_);
  });

  ScanResult    result;
  sequence_id_t next = 1;
  for (auto& entry : found) {
    if (entry.readable_) {
      entry.sequence_ = next++;
      result.entries_.push_back(std::move(entry));
    } else {
      result.skipped_.push_back(std::move(entry));
    }
  }
  return result;
}
};  // namespace photopackager
