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

#include "job/file_outcome.hpp"

#include <string>
#include <utility>

namespace photopackager {
auto FileOutcome::Success(sequence_id_t sequence, const image_path_t& source,
                          OutputCategory category, image_path_t output_path) -> FileOutcome {
  FileOutcome outcome;
  outcome.sequence_    = sequence;
  outcome.source_      = source;
  outcome.category_    = category;
  outcome.status_      = OutcomeStatus::SUCCESS;
  outcome.output_path_ = std::move(output_path);
  return outcome;
}

auto FileOutcome::Skipped(sequence_id_t sequence, const image_path_t& source,
                          OutputCategory category, FailureCode code, std::string reason)
    -> FileOutcome {
  FileOutcome outcome;
  outcome.sequence_ = sequence;
  outcome.source_   = source;
  outcome.category_ = category;
  outcome.status_   = OutcomeStatus::SKIPPED;
  outcome.code_     = code;
  outcome.reason_   = std::move(reason);
  return outcome;
}

auto FileOutcome::Failed(sequence_id_t sequence, const image_path_t& source,
                         OutputCategory category, FailureCode code, std::string reason)
    -> FileOutcome {
  FileOutcome outcome;
  outcome.sequence_ = sequence;
  outcome.source_   = source;
  outcome.category_ = category;
  outcome.status_   = OutcomeStatus::FAILED;
  outcome.code_     = code;
  outcome.reason_   = std::move(reason);
  return outcome;
}

auto JobSummary::Counts(OutputCategory category) const -> CategoryCounts {
  auto it = counts_.find(category);
  return it == counts_.end() ? CategoryCounts{} : it->second;
}

auto JobSummary::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["output_root"]     = output_root_.string();
  j["dry_run"]         = dry_run_;
  j["canceled"]        = canceled_;
  j["elapsed_ms"]      = elapsed_.count();
  j["total_sources"]   = total_sources_;
  j["skipped_sources"] = skipped_sources_;

  nlohmann::json counts = nlohmann::json::object();
  for (const auto& [category, c] : counts_) {
    counts[CategoryName(category)] = {
        {"succeeded", c.succeeded_}, {"skipped", c.skipped_}, {"failed", c.failed_}};
  }
  j["categories"] = counts;
  j["warnings"]   = warnings_;
  j["errors"]     = errors_;

  nlohmann::json archives = nlohmann::json::array();
  for (const auto& path : archives_) {
    archives.push_back(path.string());
  }
  j["archives"] = archives;
  return j;
}

auto OutcomeStatusName(OutcomeStatus status) -> const char* {
  switch (status) {
    case OutcomeStatus::SUCCESS:
      return "success";
    case OutcomeStatus::SKIPPED:
      return "skipped";
    case OutcomeStatus::FAILED:
      return "failed";
  }
  return "unknown";
}

auto FailureCodeName(FailureCode code) -> const char* {
  switch (code) {
    case FailureCode::NONE:
      return "none";
    case FailureCode::SOURCE_UNREADABLE:
      return "source-unreadable";
    case FailureCode::UNSUPPORTED_SOURCE:
      return "unsupported-source";
    case FailureCode::DECODE_FAILED:
      return "decode-failed";
    case FailureCode::ENCODE_FAILED:
      return "encode-failed";
    case FailureCode::WRITE_FAILED:
      return "write-failed";
    case FailureCode::MOVE_VERIFICATION_FAILED:
      return "move-verification-failed";
    case FailureCode::SOURCE_DELETE_FAILED:
      return "source-delete-failed";
    case FailureCode::ARCHIVE_FAILED:
      return "archive-failed";
    case FailureCode::CANCELED:
      return "canceled";
  }
  return "unknown";
}
};  // namespace photopackager
