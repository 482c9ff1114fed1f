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

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "archive/archiver.hpp"
#include "job/job_error.hpp"
#include "package_test_fixation.hpp"

namespace photopackager {
namespace {
// Fails every copy, as a full or detached destination would
class BrokenCopyMutator : public FileMutatorImpl {
 public:
  void CopyFile(const file_path_t&, const file_path_t&) override {
    throw std::runtime_error("no space left on device");
  }
};

auto ReadText(const std::filesystem::path& path) -> std::string {
  std::ifstream     file(path);
  std::stringstream content;
  content << file.rdbuf();
  return content.str();
}
}  // namespace

class PackageJobTests : public PackageTestFixture {
 protected:
  auto BaseSpec() const -> JobSpec {
    JobSpec spec;
    spec.source_dir_      = source_dir_;
    spec.output_parent_   = output_parent_;
    spec.shoot_base_name_ = "Demo";
    spec.worker_count_    = 2;
    return spec;
  }

  static void OnlyEnable(JobSpec& spec, OutputCategory category) {
    spec.optimized_jpeg_.enabled_  = category == OutputCategory::OPTIMIZED_JPEG;
    spec.optimized_webp_.enabled_  = category == OutputCategory::OPTIMIZED_WEBP;
    spec.compressed_jpeg_.enabled_ = category == OutputCategory::COMPRESSED_JPEG;
    spec.compressed_webp_.enabled_ = category == OutputCategory::COMPRESSED_WEBP;
  }

  auto Root() const -> std::filesystem::path { return output_parent_ / "Demo"; }

  void WriteSources() {
    WriteImage(source_dir_ / "a.jpg", MakeGradient(300, 200));
    WriteImage(source_dir_ / "b.png", MakeNoise(120, 80));
    WriteImage(source_dir_ / "c.jpg", MakeNoise(90, 60));
  }

  static auto CountsEqual(const JobSummary& lhs, const JobSummary& rhs) -> bool {
    return std::all_of(kAllCategories.begin(), kAllCategories.end(), [&](OutputCategory c) {
      return lhs.Counts(c) == rhs.Counts(c);
    });
  }
};

TEST_F(PackageJobTests, CopyWithOptimizedJpeg) {
  WriteImage(source_dir_ / "a.jpg", MakeGradient(3000, 2000));
  WriteImage(source_dir_ / "b.png", MakeNoise(64, 48));

  JobSpec spec = BaseSpec();
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob job(spec);
  const auto summary = job.Run();

  const auto originals = Root() / "Export Originals";
  const auto optimized = Root() / "Optimized Files" / "Optimized JPGs";
  EXPECT_TRUE(std::filesystem::exists(originals / "001-Demo.jpg"));
  EXPECT_TRUE(std::filesystem::exists(originals / "002-Demo.png"));
  EXPECT_TRUE(std::filesystem::exists(optimized / "001-Demo.jpg"));
  EXPECT_TRUE(std::filesystem::exists(optimized / "002-Demo.jpg"));
  EXPECT_FALSE(std::filesystem::exists(Root() / "Optimized Files" / "Optimized WebPs"));
  EXPECT_FALSE(std::filesystem::exists(Root() / "Compressed Files"));

  const cv::Mat derived = cv::imread((optimized / "001-Demo.jpg").string());
  EXPECT_EQ(derived.size(), cv::Size(3000, 2000));

  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{2, 0, 0}));
  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_JPEG), (CategoryCounts{2, 0, 0}));
  EXPECT_EQ(summary.total_sources_, 2u);
  EXPECT_TRUE(summary.errors_.empty());
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "a.jpg"));
  EXPECT_TRUE(std::filesystem::exists(Root() / "photopackager_run.log"));
}

TEST_F(PackageJobTests, SequenceIsSharedAcrossCategories) {
  WriteSources();
  PackageJob job(BaseSpec());
  const auto summary = job.Run();
  EXPECT_TRUE(summary.errors_.empty());

  for (const char* name : {"001-Demo", "002-Demo", "003-Demo"}) {
    const std::string stem(name);
    EXPECT_TRUE(std::filesystem::exists(Root() / "Optimized Files" / "Optimized JPGs" / (stem + ".jpg")));
    EXPECT_TRUE(std::filesystem::exists(Root() / "Optimized Files" / "Optimized WebPs" / (stem + ".webp")));
    EXPECT_TRUE(std::filesystem::exists(Root() / "Compressed Files" / "Compressed JPGs" / (stem + ".jpg")));
    EXPECT_TRUE(std::filesystem::exists(Root() / "Compressed Files" / "Compressed WebPs" / (stem + ".webp")));
  }
  // a.jpg, b.png, c.jpg in name order
  EXPECT_TRUE(std::filesystem::exists(Root() / "Export Originals" / "002-Demo.png"));
  for (OutputCategory category : kAllCategories) {
    EXPECT_EQ(summary.Counts(category).succeeded_, 3u) << CategoryName(category);
  }
}

TEST_F(PackageJobTests, DryRunLeavesDiskUntouched) {
  WriteSources();
  const auto before = Tree(work_dir_);

  JobSpec spec  = BaseSpec();
  spec.dry_run_ = true;
  PackageJob dry(spec);
  auto       channel     = dry.Subscribe();
  const auto dry_summary = dry.Run();
  EXPECT_EQ(Tree(work_dir_), before);
  EXPECT_TRUE(dry_summary.dry_run_);

  size_t dry_actions = 0;
  while (auto event = channel->try_pop()) {
    if (event->kind_ == JobEventKind::DRY_RUN_ACTION) {
      ++dry_actions;
      EXPECT_EQ(event->message_.rfind("[DRYRUN] ", 0), 0u);
    }
  }
  EXPECT_GT(dry_actions, 0u);

  PackageJob live(BaseSpec());
  const auto live_summary = live.Run();
  EXPECT_TRUE(CountsEqual(dry_summary, live_summary));
  EXPECT_EQ(dry_summary.archives_, live_summary.archives_);
  EXPECT_EQ(dry_summary.total_sources_, live_summary.total_sources_);
}

TEST_F(PackageJobTests, FailedMoveKeepsSource) {
  WriteSources();
  JobSpec spec          = BaseSpec();
  spec.originals_action_ = OriginalsAction::MOVE;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);

  PackageJob job(spec, std::make_shared<BrokenCopyMutator>(), MetadataCapabilities{});
  const auto summary = job.Run();

  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "a.jpg"));
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "b.png"));
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "c.jpg"));
  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{0, 0, 3}));
  // Derivatives are unaffected
  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_JPEG), (CategoryCounts{3, 0, 0}));
  ASSERT_EQ(summary.errors_.size(), 3u);
  for (const auto& error : summary.errors_) {
    EXPECT_NE(error.find("move-verification-failed"), std::string::npos) << error;
  }
  EXPECT_TRUE(Tree(Root() / "Export Originals").empty());
}

TEST_F(PackageJobTests, MoveRelocatesVerifiedOriginals) {
  WriteSources();
  const auto bytes = ReadBytes(source_dir_ / "b.png");

  JobSpec spec           = BaseSpec();
  spec.originals_action_ = OriginalsAction::MOVE;
  PackageJob job(spec);
  const auto summary = job.Run();

  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{3, 0, 0}));
  EXPECT_TRUE(Tree(source_dir_).empty());
  EXPECT_EQ(ReadBytes(Root() / "Export Originals" / "002-Demo.png"), bytes);
  // Derivatives were generated before the sources went away
  EXPECT_EQ(summary.Counts(OutputCategory::COMPRESSED_WEBP), (CategoryCounts{3, 0, 0}));
}

TEST_F(PackageJobTests, CompressedJpegRespectsPixelTarget) {
  WriteImage(source_dir_ / "big.jpg", MakeGradient(6000, 4000));
  JobSpec spec = BaseSpec();
  OnlyEnable(spec, OutputCategory::COMPRESSED_JPEG);
  spec.originals_action_ = OriginalsAction::LEAVE;
  PackageJob job(spec);
  const auto summary = job.Run();
  ASSERT_EQ(summary.Counts(OutputCategory::COMPRESSED_JPEG).succeeded_, 1u);

  const cv::Mat out =
      cv::imread((Root() / "Compressed Files" / "Compressed JPGs" / "001-Demo.jpg").string());
  ASSERT_FALSE(out.empty());
  EXPECT_LE(static_cast<uint64_t>(out.cols) * out.rows, 2'000'000u);
  EXPECT_GT(static_cast<uint64_t>(out.cols) * out.rows, 1'900'000u);
  EXPECT_LE(std::abs(out.cols - out.rows * 1.5), 1.0);
  // LEAVE creates no originals folder
  EXPECT_FALSE(std::filesystem::exists(Root() / "Export Originals"));
}

TEST_F(PackageJobTests, SelectiveStripFallsBackToStripAll) {
  const auto source = WriteImage(source_dir_ / "a.jpg", MakeGradient(64, 48));
  WriteTags(source,
            {{"Exif.Image.Make", "Canon"},
             {"Exif.Image.Artist", "Jane Doe"},
             {"Exif.Photo.DateTimeOriginal", "2024:05:01 10:00:00"}});

  JobSpec spec         = BaseSpec();
  spec.metadata_policy_ = MetadataPolicy::STRIP_DATE;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  MetadataCapabilities no_selective;
  no_selective.selective_strip_ = false;
  PackageJob job(spec, nullptr, no_selective);
  const auto summary = job.Run();

  const auto derived = Root() / "Optimized Files" / "Optimized JPGs" / "001-Demo.jpg";
  EXPECT_TRUE(ReadExif(derived).empty());
  EXPECT_TRUE(summary.errors_.empty());
  EXPECT_TRUE(std::any_of(summary.warnings_.begin(), summary.warnings_.end(),
                          [](const std::string& w) {
                            return w.find("falling back") != std::string::npos;
                          }));
  // The copied original keeps its metadata
  EXPECT_TRUE(HasKey(ReadExif(Root() / "Export Originals" / "001-Demo.jpg"), "Exif.Image.Make"));
}

TEST_F(PackageJobTests, SelectiveStripKeepsOtherTags) {
  const auto source = WriteImage(source_dir_ / "a.jpg", MakeGradient(64, 48));
  WriteTags(source, {{"Exif.Image.Artist", "Jane Doe"},
                     {"Exif.Photo.DateTimeOriginal", "2024:05:01 10:00:00"}},
            6);

  JobSpec spec          = BaseSpec();
  spec.metadata_policy_ = MetadataPolicy::STRIP_DATE;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob job(spec, nullptr, MetadataCapabilities{});
  job.Run();

  const auto derived_path = Root() / "Optimized Files" / "Optimized JPGs" / "001-Demo.jpg";
  const auto exif         = ReadExif(derived_path);
  EXPECT_TRUE(HasKey(exif, "Exif.Image.Artist"));
  EXPECT_FALSE(HasKey(exif, "Exif.Photo.DateTimeOriginal"));
  EXPECT_EQ(exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"))->toInt64(), 1);
  // Orientation 6 was applied to the pixels
  EXPECT_EQ(cv::imread(derived_path.string()).size(), cv::Size(48, 64));
}

TEST_F(PackageJobTests, CopyIsNonDestructive) {
  WriteSources();
  const auto old_time = std::filesystem::last_write_time(source_dir_ / "c.jpg") -
                        std::chrono::hours(72);
  std::filesystem::last_write_time(source_dir_ / "c.jpg", old_time);
  const auto bytes = ReadBytes(source_dir_ / "c.jpg");

  PackageJob job(BaseSpec());
  job.Run();

  EXPECT_EQ(ReadBytes(source_dir_ / "c.jpg"), bytes);
  EXPECT_EQ(std::filesystem::last_write_time(source_dir_ / "c.jpg"), old_time);
  EXPECT_EQ(std::filesystem::last_write_time(Root() / "Export Originals" / "003-Demo.jpg"),
            old_time);
}

TEST_F(PackageJobTests, RerunProducesIdenticalDerivatives) {
  WriteSources();
  PackageJob first(BaseSpec());
  first.Run();
  const auto optimized  = Root() / "Optimized Files" / "Optimized WebPs" / "002-Demo.webp";
  const auto compressed = Root() / "Compressed Files" / "Compressed JPGs" / "001-Demo.jpg";
  const auto optimized_bytes  = ReadBytes(optimized);
  const auto compressed_bytes = ReadBytes(compressed);
  const auto tree             = Tree(Root());

  PackageJob second(BaseSpec());
  const auto summary = second.Run();
  EXPECT_TRUE(summary.errors_.empty());
  EXPECT_EQ(ReadBytes(optimized), optimized_bytes);
  EXPECT_EQ(ReadBytes(compressed), compressed_bytes);
  EXPECT_EQ(Tree(Root()), tree);
}

TEST_F(PackageJobTests, RawIsDeliveredIntoItsOwnFolder) {
  WriteImage(source_dir_ / "a.jpg", MakeGradient(64, 48));
  WriteBytes(source_dir_ / "b.CR2", "not really a raw file");

  PackageJob job(BaseSpec());
  const auto summary = job.Run();

  EXPECT_TRUE(std::filesystem::exists(Root() / "Export Originals" / "001-Demo.jpg"));
  EXPECT_FALSE(std::filesystem::exists(Root() / "Export Originals" / "002-Demo.cr2"));
  EXPECT_TRUE(std::filesystem::exists(Root() / "RAW Files" / "002-Demo.cr2"));
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "b.CR2"));
  EXPECT_FALSE(std::filesystem::exists(Root() / "Optimized Files" / "Optimized JPGs" / "002-Demo.jpg"));
  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_JPEG), (CategoryCounts{1, 1, 0}));
  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{2, 0, 0}));
  EXPECT_TRUE(summary.errors_.empty());

  const std::string raw_readme = ReadText(Root() / "RAW Files" / "README.txt");
  EXPECT_NE(raw_readme.find("camera RAW files"), std::string::npos);
  const std::string readme = ReadText(Root() / "README.txt");
  EXPECT_NE(readme.find("RAW Files/"), std::string::npos);

  ASSERT_TRUE(std::filesystem::exists(Root() / "RAW Files.zip"));
  const auto entries = Archiver::ListEntries(Root() / "RAW Files.zip");
  EXPECT_NE(std::find(entries.begin(), entries.end(), "002-Demo.cr2"), entries.end());
  const auto originals = Archiver::ListEntries(Root() / "Export Originals.zip");
  EXPECT_EQ(std::find(originals.begin(), originals.end(), "002-Demo.cr2"), originals.end());

  JobSpec no_raw        = BaseSpec();
  no_raw.include_raw_   = false;
  no_raw.output_parent_ = work_dir_ / "no_raw";
  PackageJob filtered(no_raw);
  EXPECT_EQ(filtered.Run().total_sources_, 1u);
  EXPECT_FALSE(std::filesystem::exists(work_dir_ / "no_raw" / "Demo" / "RAW Files"));
}

TEST_F(PackageJobTests, RawActionIsIndependentOfOriginalsAction) {
  WriteImage(source_dir_ / "a.jpg", MakeGradient(64, 48));
  WriteBytes(source_dir_ / "b.NEF", "raw sensor data");

  JobSpec spec           = BaseSpec();
  spec.originals_action_ = OriginalsAction::COPY;
  spec.raw_action_       = RawAction::MOVE;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob move_raw(spec);
  const auto summary = move_raw.Run();

  EXPECT_TRUE(summary.errors_.empty());
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "a.jpg"));
  EXPECT_FALSE(std::filesystem::exists(source_dir_ / "b.NEF"));
  EXPECT_EQ(ReadBytes(Root() / "RAW Files" / "002-Demo.nef"), "raw sensor data");

  // Leaving RAW files creates no RAW folder at all
  WriteBytes(source_dir_ / "b.NEF", "raw sensor data");
  JobSpec leave           = BaseSpec();
  leave.output_parent_    = work_dir_ / "leave";
  leave.raw_action_       = RawAction::LEAVE;
  leave.originals_action_ = OriginalsAction::MOVE;
  OnlyEnable(leave, OutputCategory::OPTIMIZED_JPEG);
  PackageJob leave_raw(leave);
  const auto left = leave_raw.Run();

  EXPECT_TRUE(left.errors_.empty());
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "b.NEF"));
  EXPECT_FALSE(std::filesystem::exists(source_dir_ / "a.jpg"));
  EXPECT_FALSE(std::filesystem::exists(work_dir_ / "leave" / "Demo" / "RAW Files"));
  EXPECT_EQ(left.Counts(OutputCategory::ORIGINAL), (CategoryCounts{2, 0, 0}));
  const std::string readme = ReadText(work_dir_ / "leave" / "Demo" / "README.txt");
  EXPECT_EQ(readme.find("RAW Files/"), std::string::npos);
}

TEST_F(PackageJobTests, DryRunPlansRawFolderWithoutWriting) {
  WriteBytes(source_dir_ / "b.NEF", "raw sensor data");
  const auto before = Tree(work_dir_);

  JobSpec spec  = BaseSpec();
  spec.dry_run_ = true;
  PackageJob job(spec);
  auto       channel = job.Subscribe();
  job.Run();

  EXPECT_EQ(Tree(work_dir_), before);
  bool planned_readme = false;
  while (auto event = channel->pop()) {
    if (event->kind_ == JobEventKind::DRY_RUN_ACTION &&
        event->message_.find("write text file") != std::string::npos &&
        event->message_.find("RAW Files") != std::string::npos) {
      planned_readme = true;
    }
  }
  EXPECT_TRUE(planned_readme);
}

TEST_F(PackageJobTests, CorruptSourceFailsOnlyItsDerivatives) {
  WriteImage(source_dir_ / "a.jpg", MakeGradient(64, 48));
  WriteBytes(source_dir_ / "b.jpg", "garbage that is not a jpeg");

  JobSpec spec = BaseSpec();
  OnlyEnable(spec, OutputCategory::OPTIMIZED_WEBP);
  PackageJob job(spec);
  const auto summary = job.Run();

  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_WEBP), (CategoryCounts{1, 0, 1}));
  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{2, 0, 0}));
  ASSERT_EQ(summary.errors_.size(), 1u);
  EXPECT_NE(summary.errors_[0].find("decode-failed"), std::string::npos);
}

TEST_F(PackageJobTests, ArchivesEveryPopulatedFolder) {
  WriteSources();
  JobSpec spec = BaseSpec();
  spec.compressed_jpeg_.enabled_ = false;
  spec.compressed_webp_.enabled_ = false;
  PackageJob job(spec);
  const auto summary = job.Run();

  ASSERT_EQ(summary.archives_.size(), 2u);
  EXPECT_TRUE(std::filesystem::exists(Root() / "Export Originals.zip"));
  EXPECT_TRUE(std::filesystem::exists(Root() / "Optimized Files.zip"));
  EXPECT_FALSE(std::filesystem::exists(Root() / "Compressed Files.zip"));

  const auto entries = Archiver::ListEntries(Root() / "Optimized Files.zip");
  EXPECT_EQ(entries.size(), 6u);
  EXPECT_NE(std::find(entries.begin(), entries.end(), "Optimized JPGs/001-Demo.jpg"),
            entries.end());
}

TEST_F(PackageJobTests, ReadmeDescribesDelivery) {
  WriteSources();
  JobSpec spec                 = BaseSpec();
  spec.branding_.company_name_ = "Northlight Studio";
  spec.archive_                = false;
  PackageJob job(spec);
  job.Run();

  const std::string readme = ReadText(Root() / "README.txt");
  EXPECT_NE(readme.find("Northlight Studio"), std::string::npos);
  EXPECT_NE(readme.find("Optimized JPGs"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(Root() / "Export Originals.zip"));
}

TEST_F(PackageJobTests, EventsStreamThroughChannel) {
  WriteSources();
  JobSpec spec = BaseSpec();
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob job(spec);
  auto       channel = job.Subscribe();
  const auto summary = job.Run();
  EXPECT_TRUE(channel->closed());

  std::vector<JobEvent> events;
  while (auto event = channel->pop()) {
    events.push_back(std::move(*event));
  }
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().kind_, JobEventKind::JOB_STARTED);
  EXPECT_EQ(events.back().kind_, JobEventKind::JOB_FINISHED);
  const auto outcome_events = std::count_if(events.begin(), events.end(), [](const JobEvent& e) {
    return e.kind_ == JobEventKind::FILE_OUTCOME;
  });
  EXPECT_EQ(outcome_events, 6);
  uint32_t max_completed = 0;
  for (const auto& event : events) {
    if (event.kind_ != JobEventKind::PROGRESS) continue;
    EXPECT_EQ(event.total_, 3u);
    max_completed = std::max(max_completed, event.completed_);
  }
  EXPECT_EQ(max_completed, 3u);
}

TEST_F(PackageJobTests, CanceledJobSkipsRemainingFiles) {
  WriteSources();
  JobSpec spec = BaseSpec();
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob job(spec);
  job.Cancel();
  const auto summary = job.Run();

  EXPECT_TRUE(summary.canceled_);
  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_JPEG), (CategoryCounts{0, 3, 0}));
  EXPECT_EQ(summary.Counts(OutputCategory::ORIGINAL), (CategoryCounts{0, 3, 0}));
  EXPECT_TRUE(summary.archives_.empty());
  EXPECT_TRUE(Tree(Root() / "Optimized Files").size() <= 1u);
}

TEST_F(PackageJobTests, SetupFailuresThrow) {
  JobSpec missing     = BaseSpec();
  missing.source_dir_ = work_dir_ / "nope";
  PackageJob missing_job(missing);
  auto       channel = missing_job.Subscribe();
  try {
    missing_job.Run();
    FAIL() << "expected JobSetupError";
  } catch (const JobSetupError& e) {
    EXPECT_EQ(e.code(), JobErrorCode::SOURCE_MISSING);
  }
  EXPECT_TRUE(channel->closed());

  JobSpec bad_name          = BaseSpec();
  bad_name.shoot_base_name_ = "a/b";
  PackageJob bad_job(bad_name);
  EXPECT_THROW(bad_job.Run(), JobSetupError);

  WriteBytes(work_dir_ / "blocker", "file in the way");
  JobSpec blocked        = BaseSpec();
  blocked.output_parent_ = work_dir_ / "blocker";
  PackageJob blocked_job(blocked);
  try {
    blocked_job.Run();
    FAIL() << "expected JobSetupError";
  } catch (const JobSetupError& e) {
    EXPECT_EQ(e.code(), JobErrorCode::OUTPUT_NOT_CREATABLE);
  }

  PackageJob mismatched(BaseSpec(), std::make_shared<FileMutatorImpl>(true, nullptr),
                        MetadataCapabilities{});
  EXPECT_THROW(mismatched.Run(), JobSetupError);
}

TEST_F(PackageJobTests, OutputInsideRecursiveSourceIsNotScanned) {
  WriteSources();
  JobSpec spec        = BaseSpec();
  spec.recursive_     = true;
  spec.output_parent_ = source_dir_;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);

  PackageJob first(spec);
  EXPECT_EQ(first.Run().total_sources_, 3u);
  PackageJob second(spec);
  EXPECT_EQ(second.Run().total_sources_, 3u);
}
TEST_F(PackageJobTests, OutputRootEqualToSourceScansOnlyTheSource) {
  const auto shoot = work_dir_ / "Demo";
  WriteImage(shoot / "a.jpg", MakeGradient(300, 200));
  WriteImage(shoot / "b.png", MakeNoise(120, 80));
  WriteImage(shoot / "day2" / "c.jpg", MakeNoise(90, 60));

  JobSpec spec        = BaseSpec();
  spec.source_dir_    = shoot;
  spec.output_parent_ = work_dir_;
  spec.recursive_     = true;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);

  PackageJob first(spec);
  const auto summary = first.Run();
  EXPECT_EQ(summary.total_sources_, 3u);
  EXPECT_EQ(summary.Counts(OutputCategory::OPTIMIZED_JPEG), (CategoryCounts{3, 0, 0}));
  EXPECT_TRUE(std::filesystem::exists(shoot / "Export Originals" / "003-Demo.jpg"));
  EXPECT_TRUE(std::filesystem::exists(shoot / "Optimized Files" / "Optimized JPGs" / "003-Demo.jpg"));

  // The generated folders stay out of the next scan
  PackageJob second(spec);
  const auto again = second.Run();
  EXPECT_EQ(again.total_sources_, 3u);
  EXPECT_EQ(again.skipped_sources_, 0u);
}

TEST_F(PackageJobTests, SourceInsideGeneratedFolderIsRejected) {
  const auto inside = output_parent_ / "Demo" / "Export Originals";
  WriteImage(inside / "a.jpg", MakeGradient(64, 48));

  JobSpec spec     = BaseSpec();
  spec.source_dir_ = inside;
  PackageJob job(spec);
  try {
    job.Run();
    FAIL() << "expected JobSetupError";
  } catch (const JobSetupError& e) {
    EXPECT_EQ(e.code(), JobErrorCode::INVALID_SPEC);
  }
}

TEST_F(PackageJobTests, UnreadableSubdirectoryIsReportedNotSilent) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permission bits are not enforced for root";
  }
  WriteSources();
  WriteImage(source_dir_ / "locked" / "d.jpg", MakeNoise(32, 32));
  std::filesystem::permissions(source_dir_ / "locked", std::filesystem::perms::none);

  JobSpec spec    = BaseSpec();
  spec.recursive_ = true;
  OnlyEnable(spec, OutputCategory::OPTIMIZED_JPEG);
  PackageJob job(spec);
  const auto summary = job.Run();
  std::filesystem::permissions(source_dir_ / "locked", std::filesystem::perms::owner_all);

  EXPECT_EQ(summary.total_sources_, 3u);
  EXPECT_EQ(summary.skipped_sources_, 1u);
  const bool warned = std::any_of(summary.warnings_.begin(), summary.warnings_.end(),
                                  [](const std::string& w) {
                                    return w.find("locked") != std::string::npos &&
                                           w.find("cannot read directory") != std::string::npos;
                                  });
  EXPECT_TRUE(warned);
}
}  // namespace photopackager
