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

#include "utils/packed64_single_block.hpp"

#include <absl/strings/str_cat.h>

#include <algorithm>
#include <bit>

#include "error/error.hpp"
#include "store/data_input.hpp"
#include "store/data_output.hpp"
#include "utils/assert.hpp"
#include "utils/bit_packing.hpp"
#include "utils/log.hpp"
#include "utils/memory.hpp"
#include "utils/packed_ints.hpp"

namespace sbp {
namespace {

template<uint32_t Bits>
class Packed64SingleBlockImpl final : public Packed64SingleBlock {
 public:
  static constexpr uint32_t kValuesPerBlock = packed::kBlockSize64 / Bits;
  static constexpr uint64_t kMask = packed::MaxValue<uint64_t>(Bits);

  Packed64SingleBlockImpl(size_t size, IResourceManager& rm)
    : Packed64SingleBlock{size, Bits, rm} {}

  using Packed64SingleBlock::Get;
  using Packed64SingleBlock::Set;

  uint64_t Get(size_t index) const noexcept final {
    SBP_ASSERT(index < size_);
    const auto [block, shift] = Locate(index);
    return (blocks_[block] >> shift) & kMask;
  }

  void Set(size_t index, uint64_t value) noexcept final {
    SBP_ASSERT(index < size_);
    const auto [block, shift] = Locate(index);
    auto& b = blocks_[block];
    b = (b & ~(kMask << shift)) | ((value & kMask) << shift);
  }

  size_t Get(size_t index, uint64_t* values,
             size_t count) const noexcept final {
    SBP_ASSERT(index <= size_);
    count = std::min(count, size_ - std::min(index, size_));
    if (!count) {
      return 0;
    }

    const size_t origin = index;

    // go to the next block boundary
    if (const size_t offset = index % kValuesPerBlock; offset) {
      for (size_t i = offset; i < kValuesPerBlock && count; ++i, --count) {
        *values++ = Get(index++);
      }
      if (!count) {
        return index - origin;
      }
    }

    SBP_ASSERT(index % kValuesPerBlock == 0);
    if (const size_t nblocks = count / kValuesPerBlock; nblocks) {
      packed::single_block::Decode(blocks_.data() + index / kValuesPerBlock,
                                   values, nblocks, Bits);
      index += nblocks * kValuesPerBlock;
    }

    if (index > origin) {
      return index - origin;
    }

    // less than a block left
    return packed::naive::Get(*this, index, values, count);
  }

  size_t Set(size_t index, const uint64_t* values,
             size_t count) noexcept final {
    SBP_ASSERT(index <= size_);
    count = std::min(count, size_ - std::min(index, size_));
    if (!count) {
      return 0;
    }

    const size_t origin = index;

    if (const size_t offset = index % kValuesPerBlock; offset) {
      for (size_t i = offset; i < kValuesPerBlock && count; ++i, --count) {
        Set(index++, *values++);
      }
      if (!count) {
        return index - origin;
      }
    }

    SBP_ASSERT(index % kValuesPerBlock == 0);
    if (const size_t nblocks = count / kValuesPerBlock; nblocks) {
      packed::single_block::Encode(values,
                                   blocks_.data() + index / kValuesPerBlock,
                                   nblocks, Bits);
      index += nblocks * kValuesPerBlock;
    }

    if (index > origin) {
      return index - origin;
    }

    return packed::naive::Set(*this, index, values, count);
  }

  void Fill(size_t from, size_t to, uint64_t value) noexcept final {
    SBP_ASSERT(from <= to);
    to = std::min(to, size_);
    if (from >= to) {
      return;
    }

    if (to - from <= 2 * kValuesPerBlock) {
      packed::naive::Fill(*this, from, to, value);
      return;
    }

    // range spans at least one whole block
    if (const size_t offset = from % kValuesPerBlock; offset) {
      for (size_t i = offset; i < kValuesPerBlock; ++i) {
        Set(from++, value);
      }
    }
    SBP_ASSERT(from % kValuesPerBlock == 0);

    const size_t from_block = from / kValuesPerBlock;
    const size_t to_block = to / kValuesPerBlock;
    std::fill(blocks_.begin() + from_block, blocks_.begin() + to_block,
              Replicate(value));

    for (size_t i = to_block * kValuesPerBlock; i < to; ++i) {
      Set(i, value);
    }
  }

 private:
  struct Location {
    size_t block;
    uint32_t shift;
  };

  static SBP_FORCE_INLINE Location Locate(size_t index) noexcept {
    if constexpr (std::has_single_bit(Bits)) {
      constexpr uint32_t kBlockShift = std::countr_zero(kValuesPerBlock);
      return {index >> kBlockShift,
              static_cast<uint32_t>(index & (kValuesPerBlock - 1)) * Bits};
    } else {
      return {index / kValuesPerBlock,
              static_cast<uint32_t>(index % kValuesPerBlock) * Bits};
    }
  }

  // 'value' repeated in every slot of a block, padding bits are zero
  static constexpr uint64_t Replicate(uint64_t value) noexcept {
    value &= kMask;
    uint64_t block = 0;
    for (uint32_t i = 0; i < kValuesPerBlock; ++i) {
      block |= value << (i * Bits);
    }
    return block;
  }
};

template<uint32_t Bits>
Packed64SingleBlock::ptr MakeArray(size_t size, IResourceManager& rm) {
  static_assert(sizeof(Packed64SingleBlockImpl<Bits>) ==
                sizeof(Packed64SingleBlock));

  return std::make_unique<Packed64SingleBlockImpl<Bits>>(size, rm);
}

}  // namespace

Packed64SingleBlock::Packed64SingleBlock(size_t size, uint32_t bits,
                                         IResourceManager& rm)
  : size_{size},
    bits_{bits},
    blocks_(packed::RequiredBlocks(size, packed::ValuesPerBlock(bits)), 0,
            ManagedTypedAllocator<uint64_t>{rm}) {}

bool Packed64SingleBlock::IsSupported(uint32_t bits) noexcept {
  return packed::IsSupported(bits);
}

Packed64SingleBlock::ptr Packed64SingleBlock::Create(size_t size,
                                                     uint32_t bits,
                                                     IResourceManager& rm) {
  SBP_LOG_TRACE(absl::StrCat("Creating single block array of ", size,
                             " values, ", bits, " bits per value"));

  switch (bits) {
    case 1:  return MakeArray<1>(size, rm);
    case 2:  return MakeArray<2>(size, rm);
    case 3:  return MakeArray<3>(size, rm);
    case 4:  return MakeArray<4>(size, rm);
    case 5:  return MakeArray<5>(size, rm);
    case 6:  return MakeArray<6>(size, rm);
    case 7:  return MakeArray<7>(size, rm);
    case 8:  return MakeArray<8>(size, rm);
    case 9:  return MakeArray<9>(size, rm);
    case 10: return MakeArray<10>(size, rm);
    case 12: return MakeArray<12>(size, rm);
    case 16: return MakeArray<16>(size, rm);
    case 21: return MakeArray<21>(size, rm);
    case 32: return MakeArray<32>(size, rm);
    default: throw unsupported_width{bits};
  }
}

Packed64SingleBlock::ptr Packed64SingleBlock::Create(DataInput& in,
                                                     size_t size,
                                                     uint32_t bits,
                                                     IResourceManager& rm) {
  auto array = Create(size, bits, rm);

  try {
    for (auto& block : array->blocks_) {
      block = in.ReadU64();
    }
  } catch (const io_error& e) {
    SBP_LOG_ERROR(absl::StrCat("Failed to read ", array->blocks_.size(),
                               " blocks of single block array with ", bits,
                               " bits per value, error: ", e.what()));
    throw;
  }

  return array;
}

void Packed64SingleBlock::Clear() noexcept {
  std::fill(blocks_.begin(), blocks_.end(), 0);
}

uint32_t Packed64SingleBlock::ValuesPerBlock() const noexcept {
  return packed::ValuesPerBlock(bits_);
}

size_t Packed64SingleBlock::MemoryUsage() const noexcept {
  return memory::AlignObjectSize(sizeof(Packed64SingleBlock)) +
         memory::SizeOfArray<uint64_t>(blocks_.size());
}

void Packed64SingleBlock::Save(DataOutput& out) const {
  for (const auto block : blocks_) {
    out.WriteU64(block);
  }
}

std::string Packed64SingleBlock::ToString() const {
  return absl::StrCat("Packed64SingleBlock<", bits_, ">(bitsPerValue=", bits_,
                      ", size=", size_, ", blocks=", blocks_.size(), ")");
}

}  // namespace sbp
