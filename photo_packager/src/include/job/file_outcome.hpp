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

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "job/job_spec.hpp"
#include "type/type.hpp"

namespace photopackager {
enum class OutcomeStatus : uint8_t { SUCCESS = 0, SKIPPED, FAILED };

enum class FailureCode : uint8_t {
  NONE = 0,
  SOURCE_UNREADABLE,
  UNSUPPORTED_SOURCE,
  DECODE_FAILED,
  ENCODE_FAILED,
  WRITE_FAILED,
  MOVE_VERIFICATION_FAILED,
  SOURCE_DELETE_FAILED,
  ARCHIVE_FAILED,
  CANCELED
};

/**
 * @brief Result for one (source, category) pair. Appended once to the reporter and never
 * mutated afterwards.
 */
struct FileOutcome {
  sequence_id_t             sequence_ = 0;
  image_path_t              source_{};
  OutputCategory            category_ = OutputCategory::ORIGINAL;
  OutcomeStatus             status_   = OutcomeStatus::SUCCESS;
  FailureCode               code_     = FailureCode::NONE;
  // Failure cause or skip note; empty on plain success
  std::string               reason_{};
  // Empty when nothing was (or would be) written, e.g. LEAVE
  image_path_t              output_path_{};
  std::chrono::milliseconds elapsed_{0};
  // Non-fatal notes such as a metadata fallback or an unmet byte ceiling
  std::vector<std::string>  warnings_{};

  static auto Success(sequence_id_t sequence, const image_path_t& source, OutputCategory category,
                      image_path_t output_path = {}) -> FileOutcome;
  static auto Skipped(sequence_id_t sequence, const image_path_t& source, OutputCategory category,
                      FailureCode code, std::string reason) -> FileOutcome;
  static auto Failed(sequence_id_t sequence, const image_path_t& source, OutputCategory category,
                     FailureCode code, std::string reason) -> FileOutcome;
};

struct CategoryCounts {
  uint32_t succeeded_ = 0;
  uint32_t skipped_   = 0;
  uint32_t failed_    = 0;

  bool     operator==(const CategoryCounts& other) const {
    return succeeded_ == other.succeeded_ && skipped_ == other.skipped_ &&
           failed_ == other.failed_;
  }
};

struct JobSummary {
  std::map<OutputCategory, CategoryCounts> counts_{};
  std::vector<std::string>                 warnings_{};
  std::vector<std::string>                 errors_{};
  std::vector<image_path_t>                archives_{};
  image_path_t                             output_root_{};
  uint32_t                                 total_sources_   = 0;
  uint32_t                                 skipped_sources_ = 0;
  std::chrono::milliseconds                elapsed_{0};
  bool                                     dry_run_  = false;
  bool                                     canceled_ = false;

  auto Counts(OutputCategory category) const -> CategoryCounts;
  auto ToJson() const -> nlohmann::json;
};

auto OutcomeStatusName(OutcomeStatus status) -> const char*;
auto FailureCodeName(FailureCode code) -> const char*;
};  // namespace photopackager
