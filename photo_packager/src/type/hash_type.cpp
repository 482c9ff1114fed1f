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

#include "type/hash_type.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace photopackager {
namespace {
struct XXH3StateDeleter {
  void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};
}  // namespace

Hash128 Hash128::ComputeFile(const file_path_t& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Hash128: cannot open " + path.string());
  }

  std::unique_ptr<XXH3_state_t, XXH3StateDeleter> state(XXH3_createState());
  if (!state || XXH3_128bits_reset(state.get()) == XXH_ERROR) {
    throw std::runtime_error("Hash128: failed to initialize XXH3 state");
  }

  std::array<char, 1 << 16> chunk{};
  while (file) {
    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const std::streamsize got = file.gcount();
    if (got > 0 && XXH3_128bits_update(state.get(), chunk.data(), static_cast<size_t>(got)) ==
                       XXH_ERROR) {
      throw std::runtime_error("Hash128: hash update failed for " + path.string());
    }
  }
  if (file.bad()) {
    throw std::runtime_error("Hash128: read error on " + path.string());
  }
  return Hash128(XXH3_128bits_digest(state.get()));
}
};  // namespace photopackager
