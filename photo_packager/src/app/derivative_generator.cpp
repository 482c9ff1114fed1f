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

#include "app/derivative_generator.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include "derivative/quality_search.hpp"
#include "derivative/resize_planner.hpp"
#include "io/image/image_writer.hpp"

namespace photopackager {
namespace {
auto ElapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}
}  // namespace

auto DerivativeGenerator::GenerateAll(const SourceEntry& entry) const -> std::vector<FileOutcome> {
  std::vector<FileOutcome>          outcomes;
  const std::vector<OutputCategory> categories = spec_.EnabledDerivatives();
  if (categories.empty()) {
    return outcomes;
  }

  if (!IsDecodableKind(entry.kind_)) {
    for (OutputCategory category : categories) {
      outcomes.push_back(FileOutcome::Skipped(
          entry.sequence_, entry.path_, category, FailureCode::UNSUPPORTED_SOURCE,
          std::string(SourceKindName(entry.kind_)) + " sources are delivered as originals only"));
    }
    return outcomes;
  }

  const auto   start = std::chrono::steady_clock::now();
  DecodedImage decoded;
  try {
    decoded = ImageDecoder::Decode(entry.path_);
  } catch (const std::exception& e) {
    for (OutputCategory category : categories) {
      FileOutcome failed = FileOutcome::Failed(entry.sequence_, entry.path_, category,
                                               FailureCode::DECODE_FAILED, e.what());
      failed.elapsed_    = ElapsedSince(start);
      outcomes.push_back(std::move(failed));
    }
    return outcomes;
  }

  // Same policy for every category of this file
  const PolicyResult policy = policy_.Apply(decoded.metadata_, spec_.metadata_policy_);
  for (OutputCategory category : categories) {
    FileOutcome outcome = Generate(entry, decoded, policy.block_, category);
    if (!decoded.metadata_error_.empty()) {
      outcome.warnings_.push_back("source metadata unreadable: " + decoded.metadata_error_);
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

auto DerivativeGenerator::Generate(const SourceEntry& entry, const DecodedImage& decoded,
                                   const MetadataBlock& metadata, OutputCategory category) const
    -> FileOutcome {
  const auto              start    = std::chrono::steady_clock::now();
  const CategorySettings& settings = spec_.Settings(category);
  const bool              compressed = IsCompressedCategory(category);

  std::vector<uint8_t>     bytes;
  std::vector<std::string> warnings;
  try {
    cv::Mat pixels = compressed ? ResizeForBudget(decoded.pixels_, settings.target_pixels_)
                                : decoded.pixels_;

    int     start_quality = settings.quality_;
    if (settings.complexity_adaptive_) {
      start_quality = ComputeComplexityQuality(pixels, settings.quality_);
    }

    std::string   metadata_warning;
    EncodeOptions options;
    options.format_           = settings.format_;
    const MetadataBlock* meta = metadata.Empty() ? nullptr : &metadata;
    auto encoder              = [&](int quality) {
      options.quality_ = quality;
      return ImageWriter::Encode(pixels, options, meta, &metadata_warning);
    };

    if (compressed && settings.max_bytes_ > 0) {
      QualitySearchResult search =
          SearchQuality(encoder, start_quality, settings.min_quality_, settings.max_bytes_,
                        settings.max_search_iterations_);
      bytes = std::move(search.bytes_);
      if (!search.met_ceiling_) {
        warnings.push_back(search.warning_);
      }
    } else {
      bytes = encoder(start_quality);
    }
    if (!metadata_warning.empty()) {
      warnings.push_back(metadata_warning);
    }
  } catch (const std::exception& e) {
    FileOutcome failed = FileOutcome::Failed(entry.sequence_, entry.path_, category,
                                             FailureCode::ENCODE_FAILED, e.what());
    failed.elapsed_    = ElapsedSince(start);
    return failed;
  }

  const image_path_t output_path =
      layout_.OutputPath(category, entry.sequence_, FormatExtension(settings.format_));
  try {
    mutator_.WriteBytes(output_path, bytes);
  } catch (const std::exception& e) {
    FileOutcome failed = FileOutcome::Failed(entry.sequence_, entry.path_, category,
                                             FailureCode::WRITE_FAILED, e.what());
    failed.elapsed_    = ElapsedSince(start);
    return failed;
  }

  FileOutcome outcome = FileOutcome::Success(entry.sequence_, entry.path_, category, output_path);
  outcome.warnings_   = std::move(warnings);
  outcome.elapsed_    = ElapsedSince(start);
  return outcome;
}
};  // namespace photopackager
