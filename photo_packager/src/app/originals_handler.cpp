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

#include "app/originals_handler.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "type/hash_type.hpp"

namespace photopackager {
namespace {
auto ElapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

auto MoveVerificationFailed(const SourceEntry& entry, const std::string& cause) -> FileOutcome {
  return FileOutcome::Failed(entry.sequence_, entry.path_, OutputCategory::ORIGINAL,
                             FailureCode::MOVE_VERIFICATION_FAILED,
                             std::string(FailureCodeName(FailureCode::MOVE_VERIFICATION_FAILED)) +
                                 ": " + cause);
}
}  // namespace

auto OriginalsHandler::DestinationFor(const SourceEntry& entry) const -> image_path_t {
  if (entry.kind_ == SourceKind::RAW) {
    return layout_.RawPath(entry.sequence_, LowercaseExtension(entry.path_));
  }
  return layout_.OutputPath(OutputCategory::ORIGINAL, entry.sequence_,
                            LowercaseExtension(entry.path_));
}

auto OriginalsHandler::Applies(const SourceEntry& entry) const -> bool {
  return entry.kind_ == SourceKind::RAW ||
         spec_.originals_action_ != OriginalsAction::SKIP_EXPORT;
}

auto OriginalsHandler::Handle(const SourceEntry& entry) const -> std::optional<FileOutcome> {
  const auto start = std::chrono::steady_clock::now();
  FileOutcome outcome;
  if (entry.kind_ == SourceKind::RAW) {
    switch (spec_.raw_action_) {
      case RawAction::LEAVE:
        outcome = FileOutcome::Success(entry.sequence_, entry.path_, OutputCategory::ORIGINAL);
        break;
      case RawAction::COPY:
        outcome = Copy(entry);
        break;
      case RawAction::MOVE:
        outcome = Move(entry);
        break;
    }
    outcome.elapsed_ = ElapsedSince(start);
    return outcome;
  }

  switch (spec_.originals_action_) {
    case OriginalsAction::SKIP_EXPORT:
      return std::nullopt;
    case OriginalsAction::LEAVE:
      outcome = FileOutcome::Success(entry.sequence_, entry.path_, OutputCategory::ORIGINAL);
      break;
    case OriginalsAction::COPY:
      outcome = Copy(entry);
      break;
    case OriginalsAction::MOVE:
      outcome = Move(entry);
      break;
  }
  outcome.elapsed_ = ElapsedSince(start);
  return outcome;
}

auto OriginalsHandler::Copy(const SourceEntry& entry) const -> FileOutcome {
  const image_path_t dest = DestinationFor(entry);
  try {
    mutator_.CopyFile(entry.path_, dest);
  } catch (const std::exception& e) {
    return FileOutcome::Failed(entry.sequence_, entry.path_, OutputCategory::ORIGINAL,
                               FailureCode::WRITE_FAILED, e.what());
  }
  return FileOutcome::Success(entry.sequence_, entry.path_, OutputCategory::ORIGINAL, dest);
}

auto OriginalsHandler::Verify(const image_path_t& source, const image_path_t& copy) const
    -> std::string {
  std::error_code ec;
  const auto      source_size = std::filesystem::file_size(source, ec);
  if (ec) return "cannot stat source: " + ec.message();
  const auto copy_size = std::filesystem::file_size(copy, ec);
  if (ec) return "cannot stat copy: " + ec.message();
  if (source_size != copy_size) {
    return "size mismatch (source " + std::to_string(source_size) + " bytes, copy " +
           std::to_string(copy_size) + " bytes)";
  }
  if (!spec_.verify_checksum_) return {};

  try {
    const Hash128 source_hash = Hash128::ComputeFile(source);
    const Hash128 copy_hash   = Hash128::ComputeFile(copy);
    if (source_hash != copy_hash) {
      return "checksum mismatch (source " + source_hash.ToString() + ", copy " +
             copy_hash.ToString() + ")";
    }
  } catch (const std::exception& e) {
    return std::string("checksum failed: ") + e.what();
  }
  return {};
}

auto OriginalsHandler::Move(const SourceEntry& entry) const -> FileOutcome {
  const image_path_t dest = DestinationFor(entry);
  try {
    mutator_.CopyFile(entry.path_, dest);
  } catch (const std::exception& e) {
    return MoveVerificationFailed(entry, std::string("copy failed: ") + e.what());
  }

  // A dry run never produced a copy to compare against
  if (!mutator_.IsDryRun()) {
    const std::string mismatch = Verify(entry.path_, dest);
    if (!mismatch.empty()) {
      FileOutcome failed = MoveVerificationFailed(entry, mismatch);
      try {
        mutator_.RemoveFile(dest);
      } catch (const std::exception& e) {
        failed.warnings_.push_back("unverified copy retained at " + dest.string() + ": " +
                                   e.what());
      }
      return failed;
    }
  }

  try {
    mutator_.RemoveFile(entry.path_);
  } catch (const std::exception& e) {
    FileOutcome failed = FileOutcome::Failed(entry.sequence_, entry.path_,
                                             OutputCategory::ORIGINAL,
                                             FailureCode::SOURCE_DELETE_FAILED, e.what());
    failed.output_path_ = dest;
    return failed;
  }
  return FileOutcome::Success(entry.sequence_, entry.path_, OutputCategory::ORIGINAL, dest);
}
};  // namespace photopackager
