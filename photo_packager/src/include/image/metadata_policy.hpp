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

#include <cstddef>
#include <string>

#include "image/metadata_extractor.hpp"
#include "job/job_spec.hpp"

namespace photopackager {
/**
 * @brief What the linked metadata runtime can do.
 */
struct MetadataCapabilities {
  // Removing individual tags while keeping the rest
  bool        selective_strip_ = true;

  static auto Detect() -> MetadataCapabilities;
};

struct PolicyResult {
  MetadataBlock  block_{};
  // The policy actually applied, differs from the requested one after a fallback
  MetadataPolicy effective_   = MetadataPolicy::KEEP;
  bool           fell_back_   = false;
  size_t         removed_tags_ = 0;
  std::string    warning_{};
};

/**
 * @brief Decide which embedded tags survive into a derivative.
 *
 * STRIP_DATE removes the timestamp family, STRIP_CAMERA the device and lens family (maker notes
 * included), STRIP_DATE_AND_CAMERA both. Without selective capability every selective policy
 * degrades to STRIP_ALL and says so in the result; tags a policy claims to strip never survive.
 */
class MetadataPolicyEngine {
 public:
  MetadataPolicyEngine() : capabilities_(MetadataCapabilities::Detect()) {}
  explicit MetadataPolicyEngine(MetadataCapabilities capabilities) : capabilities_(capabilities) {}

  auto        Apply(const MetadataBlock& source, MetadataPolicy policy) const -> PolicyResult;
  auto        Capabilities() const -> const MetadataCapabilities& { return capabilities_; }

  static auto IsDateKey(const std::string& key) -> bool;
  static auto IsCameraKey(const std::string& key, const std::string& group) -> bool;

 private:
  MetadataCapabilities capabilities_;
};
};  // namespace photopackager
