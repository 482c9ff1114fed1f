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
#include <string>

#include "job/job_spec.hpp"
#include "job/output_layout.hpp"

namespace photopackager {
/**
 * @brief Client-facing README placed at the delivery root. Only folders the job actually fills
 * are described.
 *
 * @param prepared date printed in the header
 * @param has_raw whether the scan found camera RAW sources
 */
auto BuildDeliveryReadme(const JobSpec& spec, const OutputLayout& layout,
                         std::chrono::system_clock::time_point prepared, bool has_raw)
    -> std::string;

// Explains camera RAW files to the client, placed inside the RAW folder
auto BuildRawReadme() -> std::string;
};  // namespace photopackager
