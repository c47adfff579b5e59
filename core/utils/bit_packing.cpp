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

#include "utils/bit_packing.hpp"

#include <algorithm>
#include <utility>

#include "error/error.hpp"

namespace {

using namespace sbp::packed;

template<uint32_t N>
inline constexpr uint64_t kMask = MaxValue<uint64_t>(N);

template<uint32_t N>
inline constexpr uint32_t kValues = kBlockSize64 / N;

// ensure all computations are constexpr, i.e. no loops, no variable
// increment/decrement within a block
template<uint32_t N, typename T, size_t... I>
SBP_FORCE_INLINE void fastunpack(uint64_t in, T* SBP_RESTRICT out,
                                 std::index_sequence<I...>) noexcept {
  ((out[I] = static_cast<T>((in >> (N * I)) & kMask<N>)), ...);
}

template<uint32_t N, typename T, size_t... I>
SBP_FORCE_INLINE uint64_t fastpack(const T* SBP_RESTRICT in,
                                   std::index_sequence<I...>) noexcept {
  return (((static_cast<uint64_t>(in[I]) & kMask<N>) << (N * I)) | ...);
}

template<uint32_t N, typename T>
void unpack_blocks(const uint64_t* SBP_RESTRICT in, T* SBP_RESTRICT out,
                   size_t nblocks) noexcept {
  static_assert(N > 0 && N <= sizeof(T) * 8, "N <= 0 || N > sizeof(T) * 8");

  for (const auto* end = in + nblocks; in != end; ++in, out += kValues<N>) {
    fastunpack<N>(*in, out, std::make_index_sequence<kValues<N>>{});
  }
}

template<uint32_t N, typename T>
void pack_blocks(const T* SBP_RESTRICT in, uint64_t* SBP_RESTRICT out,
                 size_t nblocks) noexcept {
  static_assert(N > 0 && N <= sizeof(T) * 8, "N <= 0 || N > sizeof(T) * 8");

  for (const auto* end = out + nblocks; out != end; ++out, in += kValues<N>) {
    *out = fastpack<N>(in, std::make_index_sequence<kValues<N>>{});
  }
}

template<typename T>
void unpack(const uint64_t* SBP_RESTRICT in, T* SBP_RESTRICT out,
            size_t nblocks, uint32_t bits) noexcept {
  switch (bits) {
    case 1:  unpack_blocks<1>(in, out, nblocks); break;
    case 2:  unpack_blocks<2>(in, out, nblocks); break;
    case 3:  unpack_blocks<3>(in, out, nblocks); break;
    case 4:  unpack_blocks<4>(in, out, nblocks); break;
    case 5:  unpack_blocks<5>(in, out, nblocks); break;
    case 6:  unpack_blocks<6>(in, out, nblocks); break;
    case 7:  unpack_blocks<7>(in, out, nblocks); break;
    case 8:  unpack_blocks<8>(in, out, nblocks); break;
    case 9:  unpack_blocks<9>(in, out, nblocks); break;
    case 10: unpack_blocks<10>(in, out, nblocks); break;
    case 12: unpack_blocks<12>(in, out, nblocks); break;
    case 16: unpack_blocks<16>(in, out, nblocks); break;
    case 21: unpack_blocks<21>(in, out, nblocks); break;
    case 32: unpack_blocks<32>(in, out, nblocks); break;
    default: SBP_ASSERT(false, "unsupported number of bits per value"); break;
  }
}

template<typename T>
void pack(const T* SBP_RESTRICT in, uint64_t* SBP_RESTRICT out,
          size_t nblocks, uint32_t bits) noexcept {
  switch (bits) {
    case 1:  pack_blocks<1>(in, out, nblocks); break;
    case 2:  pack_blocks<2>(in, out, nblocks); break;
    case 3:  pack_blocks<3>(in, out, nblocks); break;
    case 4:  pack_blocks<4>(in, out, nblocks); break;
    case 5:  pack_blocks<5>(in, out, nblocks); break;
    case 6:  pack_blocks<6>(in, out, nblocks); break;
    case 7:  pack_blocks<7>(in, out, nblocks); break;
    case 8:  pack_blocks<8>(in, out, nblocks); break;
    case 9:  pack_blocks<9>(in, out, nblocks); break;
    case 10: pack_blocks<10>(in, out, nblocks); break;
    case 12: pack_blocks<12>(in, out, nblocks); break;
    case 16: pack_blocks<16>(in, out, nblocks); break;
    case 21: pack_blocks<21>(in, out, nblocks); break;
    case 32: pack_blocks<32>(in, out, nblocks); break;
    default: SBP_ASSERT(false, "unsupported number of bits per value"); break;
  }
}

}  // namespace

namespace sbp::packed {

bool IsSupported(uint32_t bits) noexcept {
  return std::binary_search(kSupportedBitsPerValue.begin(),
                            kSupportedBitsPerValue.end(), bits);
}

uint32_t RoundUpBitsPerValue(uint32_t bits) {
  const auto it = std::lower_bound(kSupportedBitsPerValue.begin(),
                                   kSupportedBitsPerValue.end(), bits);

  if (bits == 0 || it == kSupportedBitsPerValue.end()) {
    throw unsupported_width{bits};
  }

  return *it;
}

namespace single_block {

void Decode(const uint64_t* SBP_RESTRICT blocks, uint64_t* SBP_RESTRICT values,
            size_t nblocks, uint32_t bits) noexcept {
  unpack(blocks, values, nblocks, bits);
}

void Decode(const uint64_t* SBP_RESTRICT blocks, uint32_t* SBP_RESTRICT values,
            size_t nblocks, uint32_t bits) noexcept {
  unpack(blocks, values, nblocks, bits);
}

void Encode(const uint64_t* SBP_RESTRICT values, uint64_t* SBP_RESTRICT blocks,
            size_t nblocks, uint32_t bits) noexcept {
  pack(values, blocks, nblocks, bits);
}

void Encode(const uint32_t* SBP_RESTRICT values, uint64_t* SBP_RESTRICT blocks,
            size_t nblocks, uint32_t bits) noexcept {
  pack(values, blocks, nblocks, bits);
}

}  // namespace single_block
}  // namespace sbp::packed
