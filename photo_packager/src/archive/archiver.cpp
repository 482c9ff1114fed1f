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

#include "archive/archiver.hpp"

#include <zip.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace photopackager {
namespace {
// Discards the archive unless it was closed successfully
struct ZipHandle {
  zip_t* archive_ = nullptr;

  ~ZipHandle() {
    if (archive_ != nullptr) zip_discard(archive_);
  }
};

auto OpenError(int error_code) -> std::string {
  zip_error_t error;
  zip_error_init_with_code(&error, error_code);
  std::string message = zip_error_strerror(&error);
  zip_error_fini(&error);
  return message;
}

auto CollectFiles(const fs::path& folder) -> std::vector<std::pair<fs::path, std::string>> {
  std::vector<std::pair<fs::path, std::string>> files;
  for (const auto& entry : fs::recursive_directory_iterator(folder)) {
    if (!entry.is_regular_file()) continue;
    if (entry.path().extension() == ".part") continue;
    files.emplace_back(entry.path(), entry.path().lexically_relative(folder).generic_string());
  }
  std::sort(files.begin(), files.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });
  return files;
}

auto HasFiles(const fs::path& folder) -> bool {
  std::error_code ec;
  if (!fs::is_directory(folder, ec)) return false;
  for (fs::recursive_directory_iterator it(folder, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec)) return true;
  }
  return false;
}
}  // namespace

auto Archiver::WriteZip(const file_path_t& folder, const file_path_t& zip_path) -> size_t {
  int       error_code = 0;
  ZipHandle handle;
  handle.archive_ = zip_open(zip_path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
  if (handle.archive_ == nullptr) {
    throw std::runtime_error("Archiver: cannot create " + zip_path.string() + ": " +
                             OpenError(error_code));
  }

  const auto files = CollectFiles(folder);
  for (const auto& [path, name] : files) {
    zip_source_t* source = zip_source_file(handle.archive_, path.string().c_str(), 0, -1);
    if (source == nullptr) {
      throw std::runtime_error("Archiver: cannot read " + path.string() + ": " +
                               zip_strerror(handle.archive_));
    }
    const zip_int64_t index =
        zip_file_add(handle.archive_, name.c_str(), source, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (index < 0) {
      zip_source_free(source);
      throw std::runtime_error("Archiver: cannot add " + name + ": " +
                               zip_strerror(handle.archive_));
    }
    if (zip_set_file_compression(handle.archive_, static_cast<zip_uint64_t>(index),
                                 ZIP_CM_DEFLATE, 0) != 0) {
      throw std::runtime_error("Archiver: deflate unsupported for " + name + ": " +
                               zip_strerror(handle.archive_));
    }
  }

  // Sources are read here, so missing or unreadable files surface now
  if (zip_close(handle.archive_) != 0) {
    throw std::runtime_error("Archiver: cannot write " + zip_path.string() + ": " +
                             zip_strerror(handle.archive_));
  }
  handle.archive_ = nullptr;
  return files.size();
}

auto Archiver::ListEntries(const file_path_t& zip_path) -> std::vector<std::string> {
  int       error_code = 0;
  ZipHandle handle;
  handle.archive_ = zip_open(zip_path.string().c_str(), ZIP_RDONLY, &error_code);
  if (handle.archive_ == nullptr) {
    throw std::runtime_error("Archiver: cannot open " + zip_path.string() + ": " +
                             OpenError(error_code));
  }
  std::vector<std::string> names;
  const zip_int64_t        count = zip_get_num_entries(handle.archive_, 0);
  for (zip_int64_t i = 0; i < count; ++i) {
    const char* name = zip_get_name(handle.archive_, static_cast<zip_uint64_t>(i), 0);
    if (name != nullptr) names.emplace_back(name);
  }
  return names;
}

auto Archiver::ArchiveAll(const std::vector<ArchiveTarget>& planned) const
    -> std::vector<ArchiveOutcome> {
  std::vector<ArchiveOutcome> outcomes;
  for (const auto& target : planned) {
    ArchiveOutcome outcome;
    outcome.target_ = target;

    if (!mutator_.IsDryRun() && !HasFiles(target.folder_)) {
      outcome.status_ = OutcomeStatus::SKIPPED;
      outcome.reason_ = "folder is empty";
      outcomes.push_back(std::move(outcome));
      continue;
    }

    try {
      size_t written = 0;
      mutator_.CreateArchive(target.archive_path_, [&](const file_path_t& part_path) {
        written = WriteZip(target.folder_, part_path);
      });
      outcome.entries_ = written;
    } catch (const std::exception& e) {
      outcome.status_ = OutcomeStatus::FAILED;
      outcome.reason_ = e.what();
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}
};  // namespace photopackager
