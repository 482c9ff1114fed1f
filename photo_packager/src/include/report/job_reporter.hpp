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

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "job/file_outcome.hpp"
#include "job/job_spec.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/queue/queue.hpp"

namespace photopackager {
enum class JobEventKind : uint8_t {
  JOB_STARTED = 0,
  SCAN_COMPLETED,
  FILE_OUTCOME,
  PROGRESS,
  ARCHIVE,
  DRY_RUN_ACTION,
  MESSAGE,
  JOB_FINISHED
};

struct JobEvent {
  JobEventKind                          kind_     = JobEventKind::MESSAGE;
  spdlog::level::level_enum             level_    = spdlog::level::info;
  std::chrono::system_clock::time_point timestamp_{};
  sequence_id_t                         sequence_ = 0;
  std::optional<OutputCategory>         category_{};
  // Set for FILE_OUTCOME
  std::optional<FileOutcome>            outcome_{};
  std::string                           message_{};
  uint32_t                              completed_ = 0;
  uint32_t                              total_     = 0;
};

using JobEventChannel = ConcurrentBlockingQueue<JobEvent>;

/**
 * @brief Append-only, thread-safe sink for everything a job reports.
 *
 * Every event is timestamped, written through the job's spdlog logger and fanned out to the
 * subscribed channels. Outcomes are kept for the final summary.
 */
class JobReporter {
 public:
  JobReporter(const std::string& job_name, bool dry_run);
  ~JobReporter();

  JobReporter(const JobReporter&)            = delete;
  JobReporter& operator=(const JobReporter&) = delete;

  /**
   * @brief Start mirroring the log into a file. Live runs only.
   *
   * @throws spdlog::spdlog_ex if the file cannot be opened
   */
  void AttachLogFile(const file_path_t& log_file);
  void Subscribe(std::shared_ptr<JobEventChannel> channel);
  void SetSequenceWidth(size_t width) { sequence_width_ = width; }

  void Record(const FileOutcome& outcome);
  void Event(JobEventKind kind, spdlog::level::level_enum level, const std::string& message,
             sequence_id_t sequence = 0, std::optional<OutputCategory> category = std::nullopt);
  void Info(const std::string& message) { Event(JobEventKind::MESSAGE, spdlog::level::info, message); }
  // Also collected into JobSummary::warnings_
  void Warn(const std::string& message);
  // Also collected into JobSummary::errors_
  void Error(const std::string& message);
  void Progress(uint32_t completed, uint32_t total);
  void AddArchive(const file_path_t& archive_path);

  auto Outcomes() const -> std::vector<FileOutcome>;
  auto BuildSummary(const image_path_t& output_root, uint32_t total_sources,
                    uint32_t skipped_sources, std::chrono::milliseconds elapsed,
                    bool canceled) const -> JobSummary;
  // Logs the summary as JSON and flushes every sink
  void WriteSummary(const JobSummary& summary);
  // Closes subscriber channels; later events only reach the logger
  void Close();

  auto Logger() const -> std::shared_ptr<spdlog::logger> { return logger_; }
  auto IsDryRun() const -> bool { return dry_run_; }
  // Clock anchored when this reporter was created
  auto Clock() const -> const TimeProvider& { return clock_; }

 private:
  void                                          Publish(JobEvent event);
  auto                                          Tag(sequence_id_t sequence,
                                                    std::optional<OutputCategory> category) const
      -> std::string;

  std::shared_ptr<spdlog::logger>               logger_;
  TimeProvider                                  clock_{};
  bool                                          dry_run_        = false;
  size_t                                        sequence_width_ = 3;

  mutable std::mutex                            mtx_{};
  std::vector<FileOutcome>                      outcomes_{};
  std::vector<std::string>                      warnings_{};
  std::vector<std::string>                      errors_{};
  std::vector<image_path_t>                     archives_{};
  std::vector<std::shared_ptr<JobEventChannel>> subscribers_{};
};
};  // namespace photopackager
