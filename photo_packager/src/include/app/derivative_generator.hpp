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

#include <vector>

#include "decoders/image_decoder.hpp"
#include "image/metadata_policy.hpp"
#include "io/fs/file_mutator.hpp"
#include "job/file_outcome.hpp"
#include "job/job_spec.hpp"
#include "job/output_layout.hpp"
#include "scanner/source_scanner.hpp"

namespace photopackager {
/**
 * @brief Produces the optimized and compressed variants of one source image.
 *
 * Never throws for per-file problems: every failure becomes a FileOutcome for the category it
 * hit, and the remaining categories still run.
 */
class DerivativeGenerator {
 public:
  DerivativeGenerator(const JobSpec& spec, const OutputLayout& layout,
                      const MetadataPolicyEngine& policy, FileMutator& mutator)
      : spec_(spec), layout_(layout), policy_(policy), mutator_(mutator) {}

  /**
   * @brief Decode the entry once and generate every enabled derivative category.
   *
   * @param entry
   * @return one outcome per enabled derivative category, in category order
   */
  auto GenerateAll(const SourceEntry& entry) const -> std::vector<FileOutcome>;

  /**
   * @brief Resize, encode and write one category from an already decoded image.
   *
   * @param entry
   * @param decoded
   * @param metadata block that survived the metadata policy
   * @param category must be a derivative category
   * @return FileOutcome
   */
  auto Generate(const SourceEntry& entry, const DecodedImage& decoded,
                const MetadataBlock& metadata, OutputCategory category) const -> FileOutcome;

 private:
  const JobSpec&              spec_;
  const OutputLayout&         layout_;
  const MetadataPolicyEngine& policy_;
  FileMutator&                mutator_;
};
};  // namespace photopackager
