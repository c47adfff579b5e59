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

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "shared.hpp"
#include "utils/source_location.hpp"

namespace sbp::log {

// use a prefix that does not clash with any predefined macros (e.g. win32
// 'ERROR')
enum class Level : uint8_t {
  kFatal = 0,
  kError,
  kWarn,
  kInfo,
  kDebug,
  kTrace,
};

inline constexpr size_t kNumLevels = static_cast<size_t>(Level::kTrace) + 1;

using Callback = void (*)(SourceLocation&& location, std::string_view message);

// nullptr disables the level, returns previous callback
// not thread-safe
SBPACK_API Callback SetCallback(Level level, Callback callback) noexcept;
SBPACK_API bool Enabled(Level level) noexcept;
SBPACK_API void Message(Level level, SourceLocation&& location,
                        std::string_view message);

}  // namespace sbp::log

#define SBP_LOG(level, message)                                   \
  do {                                                            \
    if (::sbp::log::Enabled(level)) {                             \
      ::sbp::log::Message(level, SBP_SOURCE_LOCATION, (message)); \
    }                                                             \
  } while (false)

#define SBP_LOG_FATAL(message) SBP_LOG(::sbp::log::Level::kFatal, message)
#define SBP_LOG_ERROR(message) SBP_LOG(::sbp::log::Level::kError, message)
#define SBP_LOG_WARN(message) SBP_LOG(::sbp::log::Level::kWarn, message)
#define SBP_LOG_INFO(message) SBP_LOG(::sbp::log::Level::kInfo, message)
#define SBP_LOG_DEBUG(message) SBP_LOG(::sbp::log::Level::kDebug, message)
#define SBP_LOG_TRACE(message) SBP_LOG(::sbp::log::Level::kTrace, message)
