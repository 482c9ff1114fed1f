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

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "image/metadata_policy.hpp"
#include "io/fs/file_mutator.hpp"
#include "job/file_outcome.hpp"
#include "job/job_spec.hpp"
#include "report/job_reporter.hpp"

namespace photopackager {
/**
 * @brief One photo delivery run: scan, generate derivatives, handle originals, archive, report.
 *
 * Run() may be called once per instance. Cancel() and Subscribe() are safe from any thread.
 */
class PackageJob {
 public:
  explicit PackageJob(JobSpec spec);
  /**
   * @param spec
   * @param mutator replaces the default filesystem gate; its dry-run mode must match the spec
   * @param capabilities overrides the detected metadata capabilities
   */
  PackageJob(JobSpec spec, std::shared_ptr<FileMutator> mutator,
             MetadataCapabilities capabilities);

  PackageJob(const PackageJob&)            = delete;
  PackageJob& operator=(const PackageJob&) = delete;

  /**
   * @brief Execute the job and block until it finishes.
   *
   * @return JobSummary
   * @throws JobSetupError for invalid specs, a missing or unreadable source directory, or an
   * output root that cannot be created
   */
  auto Run() -> JobSummary;

  // Files already in progress finish, the rest are skipped
  void Cancel() { canceled_.store(true); }
  auto IsCanceled() const -> bool { return canceled_.load(); }

  /**
   * @brief Open a channel that receives every event of the run. It is closed when Run() returns.
   */
  auto Subscribe() -> std::shared_ptr<JobEventChannel>;

  auto Spec() const -> const JobSpec& { return spec_; }

 private:
  auto                                          Execute() -> JobSummary;
  void                                          CloseSubscribers();

  JobSpec                                       spec_;
  std::shared_ptr<FileMutator>                  mutator_;
  MetadataCapabilities                          capabilities_;
  std::atomic<bool>                             canceled_{false};

  std::mutex                                    subscribers_mtx_{};
  std::vector<std::shared_ptr<JobEventChannel>> subscribers_{};
};
};  // namespace photopackager
