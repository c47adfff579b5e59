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

#include <bit>
#include <cstddef>

#include "shared.hpp"

namespace sbp::memory {

// granularity of heap allocations on the host platform
inline constexpr size_t kObjectAlignment = alignof(std::max_align_t);

static_assert(std::has_single_bit(kObjectAlignment));

constexpr size_t AlignUp(size_t size, size_t alignment) noexcept {
  return (size + alignment - 1) & ~(alignment - 1);
}

constexpr size_t AlignObjectSize(size_t size) noexcept {
  return AlignUp(size, kObjectAlignment);
}

// estimated number of bytes used by a heap allocated array of 'count'
// elements of type T
template<typename T>
constexpr size_t SizeOfArray(size_t count) noexcept {
  return AlignObjectSize(sizeof(T) * count);
}

}  // namespace sbp::memory
