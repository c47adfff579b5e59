////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2023 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "utils/log.hpp"

#include <array>
#include <utility>

#include "utils/assert.hpp"

namespace sbp::log {
namespace {

std::array<Callback, kNumLevels> gCallbacks{};

size_t ToIndex(Level level) noexcept {
  const auto idx = static_cast<size_t>(level);
  SBP_ASSERT(idx < kNumLevels);
  return idx;
}

}  // namespace

Callback SetCallback(Level level, Callback callback) noexcept {
  return std::exchange(gCallbacks[ToIndex(level)], callback);
}

bool Enabled(Level level) noexcept {
  return gCallbacks[ToIndex(level)] != nullptr;
}

void Message(Level level, SourceLocation&& location,
             std::string_view message) {
  if (auto* callback = gCallbacks[ToIndex(level)]; callback != nullptr) {
    callback(std::move(location), message);
  }
}

}  // namespace sbp::log
