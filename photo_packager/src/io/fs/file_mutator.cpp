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

#include "io/fs/file_mutator.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace photopackager {
namespace {
void DiscardPart(const file_path_t& part) {
  std::error_code ec;
  fs::remove(part, ec);
}

void WriteBuffer(const file_path_t& dest, const char* data, size_t size) {
  const file_path_t part = PartPath(dest);
  try {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("FileMutator: cannot open " + part.string() + " for writing");
    }
    out.write(data, static_cast<std::streamsize>(size));
    out.close();
    if (!out) {
      throw std::runtime_error("FileMutator: write error on " + part.string());
    }
    fs::rename(part, dest);
  } catch (...) {
    DiscardPart(part);
    throw;
  }
}
}  // namespace

auto PartPath(const file_path_t& dest) -> file_path_t {
  file_path_t part = dest;
  part += ".part";
  return part;
}

void FileMutatorImpl::Notice(const std::string& message) const {
  if (on_notice_) {
    on_notice_("[DRYRUN] " + message);
  }
}

void FileMutatorImpl::CreateDirectories(const file_path_t& dir) {
  if (dry_run_) {
    Notice("create directory " + dir.string());
    return;
  }
  fs::create_directories(dir);
  if (!fs::is_directory(dir)) {
    throw std::runtime_error("FileMutator: " + dir.string() + " is not a directory");
  }
}

void FileMutatorImpl::WriteBytes(const file_path_t& dest, const std::vector<uint8_t>& bytes) {
  if (dry_run_) {
    Notice("write " + std::to_string(bytes.size()) + " bytes to " + dest.string());
    return;
  }
  WriteBuffer(dest, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void FileMutatorImpl::WriteText(const file_path_t& dest, const std::string& text) {
  if (dry_run_) {
    Notice("write text file " + dest.string());
    return;
  }
  WriteBuffer(dest, text.data(), text.size());
}

void FileMutatorImpl::CopyFile(const file_path_t& src, const file_path_t& dest) {
  if (dry_run_) {
    Notice("copy " + src.string() + " to " + dest.string());
    return;
  }
  const file_path_t part = PartPath(dest);
  try {
    fs::copy_file(src, part, fs::copy_options::overwrite_existing);
    fs::last_write_time(part, fs::last_write_time(src));
    fs::rename(part, dest);
  } catch (...) {
    DiscardPart(part);
    throw;
  }
}

void FileMutatorImpl::RemoveFile(const file_path_t& path) {
  if (dry_run_) {
    Notice("remove " + path.string());
    return;
  }
  if (!fs::remove(path)) {
    throw std::runtime_error("FileMutator: " + path.string() + " does not exist");
  }
}

void FileMutatorImpl::CreateArchive(const file_path_t& archive_path, const ArchiveBuilder& build) {
  if (dry_run_) {
    Notice("create archive " + archive_path.string());
    return;
  }
  const file_path_t part = PartPath(archive_path);
  try {
    DiscardPart(part);
    build(part);
    fs::rename(part, archive_path);
  } catch (...) {
    DiscardPart(part);
    throw;
  }
}
};  // namespace photopackager
