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

#include "report/job_reporter.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <atomic>
#include <tuple>
#include <utility>

#include "job/output_layout.hpp"
#include "utils/clock/time_provider.hpp"

namespace photopackager {
namespace {
std::atomic<uint64_t> logger_counter{0};

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

auto OutcomeLevel(const FileOutcome& outcome) -> spdlog::level::level_enum {
  switch (outcome.status_) {
    case OutcomeStatus::SUCCESS:
      return outcome.warnings_.empty() ? spdlog::level::info : spdlog::level::warn;
    case OutcomeStatus::SKIPPED:
      return spdlog::level::info;
    case OutcomeStatus::FAILED:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}
}  // namespace

JobReporter::JobReporter(const std::string& job_name, bool dry_run) : dry_run_(dry_run) {
  auto console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
  // Not registered globally, so concurrent jobs with the same name never collide
  logger_      = std::make_shared<spdlog::logger>(
      "photopackager." + job_name + "." + std::to_string(logger_counter.fetch_add(1)), console);
  logger_->set_pattern(kLogPattern);
  logger_->set_level(spdlog::level::info);
  logger_->flush_on(spdlog::level::warn);
}

JobReporter::~JobReporter() {
  Close();
  logger_->flush();
}

void JobReporter::AttachLogFile(const file_path_t& log_file) {
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
  file_sink->set_pattern(kLogPattern);
  std::lock_guard<std::mutex> lock(mtx_);
  logger_->sinks().push_back(std::move(file_sink));
}

void JobReporter::Subscribe(std::shared_ptr<JobEventChannel> channel) {
  if (!channel) return;
  std::lock_guard<std::mutex> lock(mtx_);
  subscribers_.push_back(std::move(channel));
}

auto JobReporter::Tag(sequence_id_t sequence, std::optional<OutputCategory> category) const
    -> std::string {
  std::string tag;
  if (sequence != 0) {
    tag += "[" + FormatSequence(sequence, sequence_width_) + "]";
  }
  if (category.has_value()) {
    tag += "[" + std::string(CategoryName(*category)) + "]";
  }
  if (!tag.empty()) tag += " ";
  return tag;
}

void JobReporter::Publish(JobEvent event) {
  // Holding the lock keeps the log and every channel in the same order
  std::lock_guard<std::mutex> lock(mtx_);
  logger_->log(event.level_, "{}{}", Tag(event.sequence_, event.category_), event.message_);
  for (const auto& channel : subscribers_) {
    channel->push(event);
  }
}

void JobReporter::Event(JobEventKind kind, spdlog::level::level_enum level,
                        const std::string& message, sequence_id_t sequence,
                        std::optional<OutputCategory> category) {
  JobEvent event;
  event.kind_      = kind;
  event.level_     = level;
  event.timestamp_ = clock_.Now();
  event.sequence_  = sequence;
  event.category_  = category;
  event.message_   = message;
  Publish(std::move(event));
}

void JobReporter::Warn(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    warnings_.push_back(message);
  }
  Event(JobEventKind::MESSAGE, spdlog::level::warn, message);
}

void JobReporter::Error(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    errors_.push_back(message);
  }
  Event(JobEventKind::MESSAGE, spdlog::level::err, message);
}

void JobReporter::Record(const FileOutcome& outcome) {
  std::string message = OutcomeStatusName(outcome.status_);
  if (!outcome.output_path_.empty()) {
    message += " -> " + outcome.output_path_.string();
  } else {
    message += " " + outcome.source_.filename().string();
  }
  if (outcome.code_ != FailureCode::NONE) {
    message += " (" + std::string(FailureCodeName(outcome.code_));
    if (!outcome.reason_.empty()) message += ": " + outcome.reason_;
    message += ")";
  }
  message += " in " + std::to_string(outcome.elapsed_.count()) + " ms";
  for (const auto& warning : outcome.warnings_) {
    message += "; warning: " + warning;
  }

  JobEvent event;
  event.kind_      = JobEventKind::FILE_OUTCOME;
  event.level_     = OutcomeLevel(outcome);
  event.timestamp_ = clock_.Now();
  event.sequence_  = outcome.sequence_;
  event.category_  = outcome.category_;
  event.outcome_   = outcome;
  event.message_   = std::move(message);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    outcomes_.push_back(outcome);
  }
  Publish(std::move(event));
}

void JobReporter::Progress(uint32_t completed, uint32_t total) {
  JobEvent event;
  event.kind_      = JobEventKind::PROGRESS;
  event.level_     = spdlog::level::debug;
  event.timestamp_ = clock_.Now();
  event.completed_ = completed;
  event.total_     = total;
  event.message_   = "progress " + std::to_string(completed) + "/" + std::to_string(total);
  Publish(std::move(event));
}

void JobReporter::AddArchive(const file_path_t& archive_path) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    archives_.push_back(archive_path);
  }
  Event(JobEventKind::ARCHIVE, spdlog::level::info, "archive " + archive_path.string());
}

auto JobReporter::Outcomes() const -> std::vector<FileOutcome> {
  std::vector<FileOutcome> snapshot;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot = outcomes_;
  }
  std::stable_sort(snapshot.begin(), snapshot.end(),
                   [](const FileOutcome& lhs, const FileOutcome& rhs) {
                     return std::tie(lhs.sequence_, lhs.category_) <
                            std::tie(rhs.sequence_, rhs.category_);
                   });
  return snapshot;
}

auto JobReporter::BuildSummary(const image_path_t& output_root, uint32_t total_sources,
                               uint32_t skipped_sources, std::chrono::milliseconds elapsed,
                               bool canceled) const -> JobSummary {
  JobSummary summary;
  summary.output_root_     = output_root;
  summary.total_sources_   = total_sources;
  summary.skipped_sources_ = skipped_sources;
  summary.elapsed_         = elapsed;
  summary.dry_run_         = dry_run_;
  summary.canceled_        = canceled;

  {
    std::lock_guard<std::mutex> lock(mtx_);
    summary.warnings_ = warnings_;
    summary.errors_   = errors_;
    summary.archives_ = archives_;
  }

  for (const auto& outcome : Outcomes()) {
    CategoryCounts& counts = summary.counts_[outcome.category_];
    const std::string tag  = Tag(outcome.sequence_, outcome.category_);
    switch (outcome.status_) {
      case OutcomeStatus::SUCCESS:
        ++counts.succeeded_;
        break;
      case OutcomeStatus::SKIPPED:
        ++counts.skipped_;
        break;
      case OutcomeStatus::FAILED:
        ++counts.failed_;
        summary.errors_.push_back(tag + FailureCodeName(outcome.code_) + ": " + outcome.reason_);
        break;
    }
    for (const auto& warning : outcome.warnings_) {
      summary.warnings_.push_back(tag + warning);
    }
  }
  return summary;
}

void JobReporter::WriteSummary(const JobSummary& summary) {
  Event(JobEventKind::JOB_FINISHED, spdlog::level::info, "summary " + summary.ToJson().dump());
  logger_->flush();
}

void JobReporter::Close() {
  std::vector<std::shared_ptr<JobEventChannel>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    subscribers.swap(subscribers_);
  }
  for (const auto& channel : subscribers) {
    channel->close();
  }
}
};  // namespace photopackager
