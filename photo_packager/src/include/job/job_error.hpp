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

#include <cstdint>
#include <stdexcept>
#include <string>

namespace photopackager {
enum class JobErrorCode : uint8_t {
  UNKNOWN = 0,
  INVALID_SPEC,
  SOURCE_MISSING,
  SOURCE_NOT_DIRECTORY,
  SOURCE_UNREADABLE,
  OUTPUT_NOT_CREATABLE
};

/**
 * @brief Directory-level setup failure. The only kind of error that aborts a whole job.
 */
class JobSetupError : public std::runtime_error {
 public:
  JobSetupError(JobErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto code() const -> JobErrorCode { return code_; }

 private:
  JobErrorCode code_;
};
};  // namespace photopackager
