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

#include "app/package_job.hpp"

#include <spdlog/common.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "app/derivative_generator.hpp"
#include "app/job_scheduler.hpp"
#include "app/originals_handler.hpp"
#include "archive/archiver.hpp"
#include "image/metadata_extractor.hpp"
#include "job/job_error.hpp"
#include "job/output_layout.hpp"
#include "report/delivery_readme.hpp"
#include "scanner/source_scanner.hpp"

namespace photopackager {
namespace {
auto IsSelectivePolicy(MetadataPolicy policy) -> bool {
  return policy == MetadataPolicy::STRIP_DATE || policy == MetadataPolicy::STRIP_CAMERA ||
         policy == MetadataPolicy::STRIP_DATE_AND_CAMERA;
}

void EnsureOutputParentUsable(const image_path_t& output_parent) {
  std::error_code ec;
  if (std::filesystem::exists(output_parent, ec) &&
      !std::filesystem::is_directory(output_parent, ec)) {
    throw JobSetupError(JobErrorCode::OUTPUT_NOT_CREATABLE,
                        "output parent is not a directory: " + output_parent.string());
  }
}

auto Normalize(const image_path_t& path) -> image_path_t {
  std::error_code ec;
  auto            canonical = std::filesystem::weakly_canonical(path, ec);
  return ec ? path.lexically_normal() : canonical;
}

// True when path is root itself or lies below it
auto IsWithin(const image_path_t& path, const image_path_t& root) -> bool {
  const auto rel = path.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}

/**
 * @brief Trees the scan must skip so a run never picks up its own output.
 *
 * An output root inside the source tree is skipped whole. When the output root holds the source
 * directory, only the folders the job generates are skipped.
 *
 * @throws JobSetupError if the source lies inside a generated folder
 */
auto ScanExclusions(const JobSpec& spec) -> std::vector<image_path_t> {
  const OutputLayout planned = OutputLayout::Resolve(spec, 0);
  const image_path_t source  = Normalize(spec.source_dir_);
  if (!IsWithin(source, Normalize(planned.Root()))) {
    return {planned.Root()};
  }
  const std::vector<image_path_t> generated = planned.GeneratedDirs();
  for (const auto& dir : generated) {
    if (IsWithin(source, Normalize(dir))) {
      throw JobSetupError(JobErrorCode::INVALID_SPEC,
                          "source directory " + spec.source_dir_.string() +
                              " lies inside the generated folder " + dir.string());
    }
  }
  return generated;
}

// Targets that will receive at least one file
auto PlannedArchives(const OutputLayout& layout, const std::vector<FileOutcome>& outcomes)
    -> std::vector<ArchiveTarget> {
  std::vector<ArchiveTarget> planned;
  for (const auto& target : layout.ArchiveTargets()) {
    const bool populated =
        std::any_of(outcomes.begin(), outcomes.end(), [&target](const FileOutcome& outcome) {
          return outcome.status_ == OutcomeStatus::SUCCESS && !outcome.output_path_.empty() &&
                 IsWithin(outcome.output_path_, target.folder_);
        });
    if (populated) planned.push_back(target);
  }
  return planned;
}
}  // namespace

PackageJob::PackageJob(JobSpec spec)
    : spec_(std::move(spec)),
      mutator_(std::make_shared<FileMutatorImpl>(spec_.dry_run_, nullptr)),
      capabilities_(MetadataCapabilities::Detect()) {}

PackageJob::PackageJob(JobSpec spec, std::shared_ptr<FileMutator> mutator,
                       MetadataCapabilities capabilities)
    : spec_(std::move(spec)), mutator_(std::move(mutator)), capabilities_(capabilities) {
  if (!mutator_) {
    mutator_ = std::make_shared<FileMutatorImpl>(spec_.dry_run_, nullptr);
  }
}

auto PackageJob::Subscribe() -> std::shared_ptr<JobEventChannel> {
  auto                        channel = std::make_shared<JobEventChannel>();
  std::lock_guard<std::mutex> lock(subscribers_mtx_);
  subscribers_.push_back(channel);
  return channel;
}

void PackageJob::CloseSubscribers() {
  std::lock_guard<std::mutex> lock(subscribers_mtx_);
  for (const auto& channel : subscribers_) {
    channel->close();
  }
}

auto PackageJob::Run() -> JobSummary {
  try {
    JobSummary summary = Execute();
    mutator_->SetNoticeCallback(nullptr);
    CloseSubscribers();
    return summary;
  } catch (...) {
    // The notice callback points at a reporter that no longer exists
    mutator_->SetNoticeCallback(nullptr);
    CloseSubscribers();
    throw;
  }
}

auto PackageJob::Execute() -> JobSummary {
  const auto started = std::chrono::steady_clock::now();

  ValidateJobSpec(spec_);
  if (mutator_->IsDryRun() != spec_.dry_run_) {
    throw JobSetupError(JobErrorCode::INVALID_SPEC,
                        "file mutator dry-run mode does not match the job spec");
  }

  ScanOptions scan_options;
  scan_options.recursive_   = spec_.recursive_;
  scan_options.include_raw_ = spec_.include_raw_;
  scan_options.exclude_     = ScanExclusions(spec_);
  const ScanResult scan     = SourceScanner::Scan(spec_.source_dir_, scan_options);

  const bool has_raw = std::any_of(scan.entries_.begin(), scan.entries_.end(),
                                   [](const SourceEntry& e) { return e.kind_ == SourceKind::RAW; });

  const OutputLayout layout = OutputLayout::Resolve(spec_, scan.entries_.size());
  JobReporter        reporter(spec_.shoot_base_name_, spec_.dry_run_);
  reporter.SetSequenceWidth(layout.SequenceWidth());
  {
    std::lock_guard<std::mutex> lock(subscribers_mtx_);
    for (const auto& channel : subscribers_) {
      reporter.Subscribe(channel);
    }
  }
  mutator_->SetNoticeCallback([&reporter](const std::string& message) {
    reporter.Event(JobEventKind::DRY_RUN_ACTION, spdlog::level::info, message);
  });

  // Everything the run creates lives under the output root
  try {
    EnsureOutputParentUsable(spec_.output_parent_);
    mutator_->CreateDirectories(layout.Root());
  } catch (const JobSetupError&) {
    throw;
  } catch (const std::exception& e) {
    throw JobSetupError(JobErrorCode::OUTPUT_NOT_CREATABLE,
                        "cannot create output root " + layout.Root().string() + ": " + e.what());
  }

  if (!spec_.dry_run_) {
    try {
      reporter.AttachLogFile(layout.LogFile());
    } catch (const spdlog::spdlog_ex& e) {
      reporter.Warn(std::string("log file unavailable: ") + e.what());
    }
  }

  reporter.Event(JobEventKind::JOB_STARTED, spdlog::level::info,
                 std::string(spec_.dry_run_ ? "[DRYRUN] " : "") + "packaging '" +
                     spec_.shoot_base_name_ + "' from " + spec_.source_dir_.string() + " into " +
                     layout.Root().string() + " (originals: " +
                     OriginalsActionName(spec_.originals_action_) +
                     ", raw: " + RawActionName(spec_.raw_action_) + ", metadata: " + MetadataPolicyName(spec_.metadata_policy_) + ")");
  reporter.Event(JobEventKind::SCAN_COMPLETED, spdlog::level::info,
                 "found " + std::to_string(scan.entries_.size()) + " source images, " +
                     std::to_string(scan.skipped_.size()) + " unreadable");
  for (const auto& skipped : scan.skipped_) {
    reporter.Warn("skipped " + skipped.path_.string() + ": " + skipped.skip_reason_);
  }

  const MetadataPolicyEngine policy(capabilities_);
  if (IsSelectivePolicy(spec_.metadata_policy_) && !capabilities_.selective_strip_) {
    reporter.Warn(std::string("metadata policy ") + MetadataPolicyName(spec_.metadata_policy_) +
                  " needs selective tag removal, which is unavailable; falling back to " +
                  MetadataPolicyName(MetadataPolicy::STRIP_ALL));
  }

  const bool handles_originals = spec_.originals_action_ == OriginalsAction::COPY ||
                                 spec_.originals_action_ == OriginalsAction::MOVE;
  try {
    if (handles_originals) {
      mutator_->CreateDirectories(layout.CategoryDir(OutputCategory::ORIGINAL));
    }
    if (has_raw && spec_.DeliversRaw()) {
      mutator_->CreateDirectories(layout.RawDir());
    }
    for (OutputCategory category : spec_.EnabledDerivatives()) {
      mutator_->CreateDirectories(layout.CategoryDir(category));
    }
  } catch (const std::exception& e) {
    throw JobSetupError(JobErrorCode::OUTPUT_NOT_CREATABLE,
                        std::string("cannot create output folders: ") + e.what());
  }
  if (has_raw && spec_.DeliversRaw()) {
    try {
      mutator_->WriteText(layout.RawReadme(), BuildRawReadme());
    } catch (const std::exception& e) {
      reporter.Warn(std::string("RAW README not written: ") + e.what());
    }
  }

  // Workers parse and serialize XMP concurrently
  try {
    MetadataExtractor::InitializeXmp();
  } catch (const std::exception& e) {
    reporter.Warn(std::string("XMP metadata unavailable: ") + e.what());
  }

  const DerivativeGenerator generator(spec_, layout, policy, *mutator_);
  const OriginalsHandler    originals(spec_, layout, *mutator_);

  auto                      process = [&](const SourceEntry& entry) {
    // Derivatives read the source, so they run before a MOVE can delete it
    try {
      for (const auto& outcome : generator.GenerateAll(entry)) {
        reporter.Record(outcome);
      }
      if (auto outcome = originals.Handle(entry)) {
        reporter.Record(*outcome);
      }
    } catch (const std::exception& e) {
      reporter.Error("[" + FormatSequence(entry.sequence_, layout.SequenceWidth()) +
                     "] unexpected failure on " + entry.path_.string() + ": " + e.what());
    }
  };
  auto on_canceled = [&](const SourceEntry& entry) {
    for (OutputCategory category : spec_.EnabledDerivatives()) {
      reporter.Record(FileOutcome::Skipped(entry.sequence_, entry.path_, category,
                                           FailureCode::CANCELED, "job canceled"));
    }
    if (originals.Applies(entry)) {
      reporter.Record(FileOutcome::Skipped(entry.sequence_, entry.path_,
                                           OutputCategory::ORIGINAL, FailureCode::CANCELED,
                                           "job canceled"));
    }
  };

  const JobScheduler   scheduler(ResolveWorkerCount(spec_.worker_count_));
  const SchedulerStats stats =
      scheduler.Run(scan.entries_, process, on_canceled, canceled_,
                    [&reporter](uint32_t done, uint32_t total) { reporter.Progress(done, total); });
  if (stats.canceled_ > 0) {
    reporter.Warn("job canceled, " + std::to_string(stats.canceled_) + " of " +
                  std::to_string(stats.total_) + " files not processed");
  }

  if (spec_.archive_) {
    const Archiver archiver(*mutator_);
    for (const auto& archived : archiver.ArchiveAll(PlannedArchives(layout, reporter.Outcomes()))) {
      switch (archived.status_) {
        case OutcomeStatus::SUCCESS:
          reporter.AddArchive(archived.target_.archive_path_);
          break;
        case OutcomeStatus::SKIPPED:
          reporter.Info("archive " + archived.target_.archive_path_.string() + " skipped: " +
                        archived.reason_);
          break;
        case OutcomeStatus::FAILED:
          reporter.Error(std::string(FailureCodeName(FailureCode::ARCHIVE_FAILED)) + ": " +
                         archived.target_.archive_path_.string() + ": " + archived.reason_);
          break;
      }
    }
  }

  if (spec_.write_readme_) {
    try {
      mutator_->WriteText(layout.Readme(), BuildDeliveryReadme(spec_, layout,
                                                               reporter.Clock().Anchor(), has_raw));
    } catch (const std::exception& e) {
      reporter.Warn(std::string("README not written: ") + e.what());
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  JobSummary summary =
      reporter.BuildSummary(layout.Root(), static_cast<uint32_t>(scan.entries_.size()),
                            static_cast<uint32_t>(scan.skipped_.size()), elapsed,
                            stats.canceled_ > 0);
  reporter.WriteSummary(summary);
  reporter.Close();
  return summary;
}
};  // namespace photopackager
