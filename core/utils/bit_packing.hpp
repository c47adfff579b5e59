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

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>

#include "shared.hpp"
#include "utils/assert.hpp"

namespace sbp::packed {

// block size is tied to number of bits in a storage word
inline constexpr uint32_t kBlockSize64 = sizeof(uint64_t) * 8;

inline constexpr uint32_t kMaxSupportedBitsPerValue = 32;

// sorted, every width stores floor(64 / width) values per block
inline constexpr std::array<uint32_t, 14> kSupportedBitsPerValue{
  1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 12, 16, 21, 32};

static_assert(kSupportedBitsPerValue.back() == kMaxSupportedBitsPerValue);

SBPACK_API bool IsSupported(uint32_t bits) noexcept;

// Returns the smallest supported number of bits per value which is not less
// than 'bits', throws unsupported_width if there is no such value.
SBPACK_API uint32_t RoundUpBitsPerValue(uint32_t bits);

// Returns number of bits required to represent 'value', at least 1.
constexpr uint32_t BitsRequired(uint64_t value) noexcept {
  return value ? static_cast<uint32_t>(std::bit_width(value)) : 1;
}

template<typename T>
constexpr T MaxValue(uint32_t bits) noexcept {
  SBP_ASSERT(bits <= sizeof(T) * 8U);

  return bits == sizeof(T) * 8U ? (std::numeric_limits<T>::max)()
                                : ~(~T(0) << bits);
}

constexpr uint32_t ValuesPerBlock(uint32_t bits) noexcept {
  SBP_ASSERT(bits > 0 && bits <= kBlockSize64);
  return kBlockSize64 / bits;
}

// Returns number of 64-bit blocks required to store 'count' values given
// 'values_per_block' of them fit into a single block.
constexpr size_t RequiredBlocks(size_t count,
                                uint32_t values_per_block) noexcept {
  return count / values_per_block +
         (count % values_per_block == 0 ? 0 : 1);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief bulk transcoding of the single block format where every value is
///        stored entirely within one 64-bit block, value 'i' of a block
///        occupies bits [i*bits, (i+1)*bits)
/// @note operates on whole blocks only, 'values' must have room for
///       'nblocks * ValuesPerBlock(bits)' items, 'bits' must be supported
////////////////////////////////////////////////////////////////////////////////
namespace single_block {

SBPACK_API void Decode(const uint64_t* SBP_RESTRICT blocks,
                       uint64_t* SBP_RESTRICT values, size_t nblocks,
                       uint32_t bits) noexcept;

SBPACK_API void Decode(const uint64_t* SBP_RESTRICT blocks,
                       uint32_t* SBP_RESTRICT values, size_t nblocks,
                       uint32_t bits) noexcept;

// values are truncated to 'bits', unused high bits of a block are zeroed
SBPACK_API void Encode(const uint64_t* SBP_RESTRICT values,
                       uint64_t* SBP_RESTRICT blocks, size_t nblocks,
                       uint32_t bits) noexcept;

SBPACK_API void Encode(const uint32_t* SBP_RESTRICT values,
                       uint64_t* SBP_RESTRICT blocks, size_t nblocks,
                       uint32_t bits) noexcept;

}  // namespace single_block
}  // namespace sbp::packed
