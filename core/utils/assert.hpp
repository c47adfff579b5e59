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

#include <string_view>

#include "shared.hpp"
#include "utils/source_location.hpp"

namespace sbp::assert {

using Callback = void (*)(SourceLocation&& location, std::string_view message);
// not thread-safe
SBPACK_API Callback SetCallback(Callback callback) noexcept;
SBPACK_API void Message(SourceLocation&& location, std::string_view message);

}  // namespace sbp::assert

#ifdef SBPACK_DEBUG

#define SBP_ASSERT2(condition, message)                     \
  do {                                                      \
    if (SBP_UNLIKELY(!(condition))) {                       \
      ::sbp::assert::Message(SBP_SOURCE_LOCATION, message); \
    }                                                       \
  } while (false)

#define SBP_ASSERT1(condition)                                 \
  do {                                                         \
    if (SBP_UNLIKELY(!(condition))) {                          \
      ::sbp::assert::Message(SBP_SOURCE_LOCATION, #condition); \
    }                                                          \
  } while (false)

#define SBP_GET_MACRO(arg1, arg2, macro, ...) macro

#define SBP_ASSERT(...) \
  SBP_GET_MACRO(__VA_ARGS__, SBP_ASSERT2, SBP_ASSERT1)(__VA_ARGS__)

#else

#define SBP_ASSERT(...) ((void)1)

#endif
