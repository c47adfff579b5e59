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
#include <limits>
#include <random>
#include <span>
#include <vector>

#include "error/error.hpp"
#include "store/store_utils.hpp"
#include "tests_shared.hpp"
#include "utils/assert.hpp"
#include "utils/bit_packing.hpp"
#include "utils/log.hpp"
#include "utils/memory.hpp"

namespace {

using sbp::Packed64SingleBlock;
using sbp::packed::kSupportedBitsPerValue;

std::vector<uint64_t> GenerateValues(size_t count, uint32_t bits,
                                     uint64_t seed) {
  std::mt19937_64 gen{seed};
  const auto max = sbp::packed::MaxValue<uint64_t>(bits);

  std::vector<uint64_t> values(count);
  for (auto& value : values) {
    value = gen() & max;
  }
  return values;
}

void SetAll(Packed64SingleBlock& array, std::span<const uint64_t> values) {
  ASSERT_EQ(array.Size(), values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    array.Set(i, values[i]);
  }
}

void AssertEqual(const Packed64SingleBlock& array,
                 std::span<const uint64_t> expected) {
  ASSERT_EQ(expected.size(), array.Size());
  for (size_t i = 0; i < expected.size(); ++i) {
    ASSERT_EQ(expected[i], array.Get(i)) << "index " << i;
  }
}

// number of values a single bulk call is expected to process
size_t ExpectedChunk(size_t index, size_t count, uint32_t values_per_block) {
  const size_t offset = index % values_per_block;
  const size_t head =
    offset ? std::min(count, values_per_block - offset) : 0;
  const size_t rest = count - head;
  const size_t chunk = head + (rest / values_per_block) * values_per_block;
  return chunk ? chunk : count;
}

size_t gErrors = 0;
size_t gTraces = 0;

void CountError(sbp::SourceLocation&&, std::string_view) { ++gErrors; }
void CountTrace(sbp::SourceLocation&&, std::string_view) { ++gTraces; }

size_t gAsserts = 0;

void CountAssert(sbp::SourceLocation&&, std::string_view) { ++gAsserts; }

}  // namespace

TEST(packed64_single_block_tests, create) {
  for (const auto bits : kSupportedBitsPerValue) {
    const uint32_t values_per_block = 64 / bits;

    for (const size_t size :
         {size_t{0}, size_t{1}, size_t{values_per_block - 1},
          size_t{values_per_block}, size_t{values_per_block + 1},
          size_t{1000}}) {
      SCOPED_TRACE(testing::Message() << "bits=" << bits << " size=" << size);

      auto array = Packed64SingleBlock::Create(size, bits);
      ASSERT_NE(nullptr, array);
      ASSERT_EQ(size, array->Size());
      ASSERT_EQ(bits, array->BitsPerValue());
      ASSERT_EQ(values_per_block, array->ValuesPerBlock());

      const auto blocks = array->Blocks();
      ASSERT_EQ(sbp::packed::RequiredBlocks(size, values_per_block),
                blocks.size());
      ASSERT_GE(values_per_block * blocks.size(), size);
      if (!blocks.empty()) {
        ASSERT_LT(values_per_block * (blocks.size() - 1), size);
      }
      ASSERT_TRUE(std::all_of(blocks.begin(), blocks.end(),
                              [](uint64_t b) { return b == 0; }));
    }
  }
}

TEST(packed64_single_block_tests, create_unsupported) {
  for (const uint32_t bits : {0U, 11U, 13U, 15U, 17U, 20U, 22U, 31U, 33U,
                              64U}) {
    ASSERT_FALSE(Packed64SingleBlock::IsSupported(bits));

    try {
      Packed64SingleBlock::Create(100, bits);
      FAIL() << "bits=" << bits;
    } catch (const sbp::unsupported_width& e) {
      ASSERT_EQ(bits, e.bits_per_value());
      ASSERT_EQ(sbp::ErrorCode::unsupported_width, e.code());
      ASSERT_EQ(absl::StrCat("Unsupported number of bits per value: ", bits),
                e.what());
    }
  }

  // unsupported width is an illegal argument
  ASSERT_THROW(Packed64SingleBlock::Create(1, 11), sbp::illegal_argument);
}

TEST(packed64_single_block_tests, get_set) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);
    ASSERT_TRUE(Packed64SingleBlock::IsSupported(bits));

    auto array = Packed64SingleBlock::Create(1000, bits);
    const auto values = GenerateValues(array->Size(), bits, bits);
    SetAll(*array, values);
    AssertEqual(*array, values);

    // boundary values
    const auto max = sbp::packed::MaxValue<uint64_t>(bits);
    array->Set(0, max);
    array->Set(999, 0);
    ASSERT_EQ(max, array->Get(0));
    ASSERT_EQ(0, array->Get(999));
    ASSERT_EQ(values[1], array->Get(1));
    ASSERT_EQ(values[998], array->Get(998));
  }
}

TEST(packed64_single_block_tests, set_does_not_affect_neighbours) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    const uint32_t values_per_block = 64 / bits;
    const auto max = sbp::packed::MaxValue<uint64_t>(bits);
    auto array = Packed64SingleBlock::Create(3 * values_per_block + 5, bits);

    for (size_t i = 0; i < array->Size(); ++i) {
      array->Fill(0, array->Size(), max);
      array->Set(i, 0);
      for (size_t j = 0; j < array->Size(); ++j) {
        ASSERT_EQ(i == j ? 0 : max, array->Get(j));
      }

      array->Clear();
      array->Set(i, max);
      for (size_t j = 0; j < array->Size(); ++j) {
        ASSERT_EQ(i == j ? max : 0, array->Get(j));
      }
    }
  }
}

TEST(packed64_single_block_tests, set_truncates_value) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    const auto max = sbp::packed::MaxValue<uint64_t>(bits);
    auto array = Packed64SingleBlock::Create(3, bits);

    array->Set(1, 0xF0F0F0F0F0F0F0F5ULL);
    ASSERT_EQ(0xF0F0F0F0F0F0F0F5ULL & max, array->Get(1));
    ASSERT_EQ(0, array->Get(0));
    ASSERT_EQ(0, array->Get(2));

    array->Set(1, std::numeric_limits<uint64_t>::max());
    ASSERT_EQ(max, array->Get(1));
    ASSERT_EQ(0, array->Get(0));
    ASSERT_EQ(0, array->Get(2));
  }
}

TEST(packed64_single_block_tests, layout_3_bits) {
  auto array = Packed64SingleBlock::Create(25, 3);
  ASSERT_EQ(21, array->ValuesPerBlock());
  ASSERT_EQ(2, array->Blocks().size());

  array->Set(20, 7);
  array->Set(21, 5);

  // last value of the first block, first value of the second one
  ASSERT_EQ(uint64_t{7} << 60, array->Blocks()[0]);
  ASSERT_EQ(5, array->Blocks()[1]);
  ASSERT_EQ(7, array->Get(20));
  ASSERT_EQ(5, array->Get(21));
}

TEST(packed64_single_block_tests, layout_32_bits) {
  auto array = Packed64SingleBlock::Create(4, 32);
  ASSERT_EQ(2, array->ValuesPerBlock());
  ASSERT_EQ(2, array->Blocks().size());

  array->Set(0, 0xFFFFFFFF);
  array->Set(1, 1);

  ASSERT_EQ(0x00000001FFFFFFFFULL, array->Blocks()[0]);
  ASSERT_EQ(0, array->Blocks()[1]);
}

TEST(packed64_single_block_tests, fill_1_bit) {
  auto array = Packed64SingleBlock::Create(128, 1);
  array->Fill(10, 100, 1);

  for (size_t i = 0; i < array->Size(); ++i) {
    ASSERT_EQ(i >= 10 && i < 100 ? 1 : 0, array->Get(i)) << "index " << i;
  }

  ASSERT_EQ(~uint64_t{0} << 10, array->Blocks()[0]);
  ASSERT_EQ((uint64_t{1} << 36) - 1, array->Blocks()[1]);
}

TEST(packed64_single_block_tests, bulk_get) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    const uint32_t values_per_block = 64 / bits;
    auto array = Packed64SingleBlock::Create(5 * values_per_block + 3, bits);
    const size_t size = array->Size();
    const auto values = GenerateValues(size, bits, 42 + bits);
    SetAll(*array, values);

    std::vector<uint64_t> buf(size + 1);

    for (size_t index = 0; index <= size; ++index) {
      for (const size_t count :
           {size_t{0}, size_t{1}, size_t{values_per_block - 1},
            size_t{values_per_block}, size_t{values_per_block + 1},
            size_t{2 * values_per_block + 3}, size + 1}) {
        const size_t expected = std::min(count, size - index);

        // single call
        std::fill(buf.begin(), buf.end(), 0);
        const size_t read = array->Get(index, buf.data(), count);
        ASSERT_EQ(ExpectedChunk(index, expected, values_per_block), read);
        ASSERT_TRUE(
          std::equal(buf.begin(), buf.begin() + read, values.begin() + index));

        // resume until exhausted
        size_t total = 0;
        while (total < expected) {
          const size_t chunk =
            array->Get(index + total, buf.data() + total, expected - total);
          ASSERT_GT(chunk, 0);
          total += chunk;
        }
        ASSERT_EQ(expected, total);
        ASSERT_TRUE(
          std::equal(buf.begin(), buf.begin() + total, values.begin() + index));
      }
    }
  }
}

TEST(packed64_single_block_tests, bulk_set) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    const uint32_t values_per_block = 64 / bits;
    const size_t size = 5 * values_per_block + 3;
    const auto background = GenerateValues(size, bits, 1);
    const auto values = GenerateValues(size + 1, bits, 2);

    auto actual = Packed64SingleBlock::Create(size, bits);
    auto expected = Packed64SingleBlock::Create(size, bits);

    for (size_t index = 0; index <= size; ++index) {
      for (const size_t count :
           {size_t{0}, size_t{1}, size_t{values_per_block - 1},
            size_t{values_per_block}, size_t{values_per_block + 1},
            size_t{2 * values_per_block + 3}, size + 1}) {
        SetAll(*actual, background);
        SetAll(*expected, background);

        const size_t to_write = std::min(count, size - index);
        for (size_t i = 0; i < to_write; ++i) {
          expected->Set(index + i, values[i]);
        }

        const size_t written = actual->Set(index, values.data(), count);
        ASSERT_EQ(ExpectedChunk(index, to_write, values_per_block), written);

        size_t total = written;
        while (total < to_write) {
          const size_t chunk = actual->Set(index + total, values.data() + total,
                                           to_write - total);
          ASSERT_GT(chunk, 0);
          total += chunk;
        }

        ASSERT_EQ(to_write, total);
        ASSERT_TRUE(std::ranges::equal(expected->Blocks(), actual->Blocks()));
      }
    }
  }
}

TEST(packed64_single_block_tests, bulk_within_last_block) {
  auto array = Packed64SingleBlock::Create(25, 3);
  const auto values = GenerateValues(25, 3, 7);
  SetAll(*array, values);

  // 4 values left in the partially filled last block
  std::vector<uint64_t> buf(10);
  ASSERT_EQ(4, array->Get(21, buf.data(), buf.size()));
  ASSERT_TRUE(std::equal(buf.begin(), buf.begin() + 4, values.begin() + 21));

  // 2 values in the middle of the last block
  ASSERT_EQ(2, array->Get(22, buf.data(), 2));
  ASSERT_EQ(values[22], buf[0]);
  ASSERT_EQ(values[23], buf[1]);

  const uint64_t update[]{1, 2, 3, 4, 5};
  ASSERT_EQ(4, array->Set(21, update, std::size(update)));
  ASSERT_EQ(1, array->Get(21));
  ASSERT_EQ(4, array->Get(24));
  ASSERT_EQ(values[20], array->Get(20));

  // past the end
  ASSERT_EQ(0, array->Get(25, buf.data(), buf.size()));
  ASSERT_EQ(0, array->Set(25, update, std::size(update)));
}

TEST(packed64_single_block_tests, bulk_span) {
  auto array = Packed64SingleBlock::Create(100, 16);
  const auto values = GenerateValues(100, 16, 3);

  size_t written = 0;
  while (written < values.size()) {
    written += array->Set(written, std::span{values}.subspan(written));
  }
  AssertEqual(*array, values);

  std::vector<uint64_t> buf(values.size());
  size_t read = 0;
  while (read < buf.size()) {
    read += array->Get(read, std::span{buf}.subspan(read));
  }
  ASSERT_EQ(values, buf);
}

TEST(packed64_single_block_tests, fill) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    const size_t vpb = 64 / bits;
    const size_t size = 4 * vpb + 7;
    const auto background = GenerateValues(size, bits, 5);
    const auto max = sbp::packed::MaxValue<uint64_t>(bits);
    auto array = Packed64SingleBlock::Create(size, bits);

    const std::pair<size_t, size_t> ranges[]{
      {0, 0},           {0, 1},           {1, 2 * vpb},
      {0, 2 * vpb},     {0, 2 * vpb + 1}, {1, 2 * vpb + 2},
      {3, size},        {vpb, 3 * vpb},   {vpb - 1, 3 * vpb + 1},
      {0, size},        {2, size + 100},  {size, size},
    };

    for (const auto value : {uint64_t{0}, max, uint64_t{1}, max >> 1}) {
      for (const auto [from, to] : ranges) {
        SCOPED_TRACE(testing::Message()
                     << "from=" << from << " to=" << to << " value=" << value);

        SetAll(*array, background);
        array->Fill(from, to, value);

        for (size_t i = 0; i < size; ++i) {
          ASSERT_EQ(i >= from && i < to ? value : background[i],
                    array->Get(i))
            << "index " << i;
        }
      }
    }
  }
}

TEST(packed64_single_block_tests, fill_keeps_padding_zero) {
  auto array = Packed64SingleBlock::Create(100, 3);
  array->Fill(0, array->Size(), 7);

  for (const auto block : array->Blocks()) {
    ASSERT_EQ(0, block >> 63);
  }

  // oversized value is truncated
  array->Fill(0, array->Size(), 0xFF);
  for (size_t i = 0; i < array->Size(); ++i) {
    ASSERT_EQ(7, array->Get(i));
  }
}

TEST(packed64_single_block_tests, clear) {
  auto array = Packed64SingleBlock::Create(1000, 5);
  SetAll(*array, GenerateValues(1000, 5, 11));

  const auto* data = array->Blocks().data();
  array->Clear();
  ASSERT_EQ(data, array->Blocks().data());
  ASSERT_EQ(1000, array->Size());
  for (size_t i = 0; i < array->Size(); ++i) {
    ASSERT_EQ(0, array->Get(i));
  }

  array->Clear();
  ASSERT_TRUE(std::ranges::all_of(array->Blocks(),
                                  [](uint64_t b) { return b == 0; }));
}

TEST(packed64_single_block_tests, save_load) {
  for (const auto bits : kSupportedBitsPerValue) {
    SCOPED_TRACE(testing::Message() << "bits=" << bits);

    auto array = Packed64SingleBlock::Create(777, bits);
    const auto values = GenerateValues(array->Size(), bits, 17);
    SetAll(*array, values);

    sbp::BytesOutput out;
    array->Save(out);
    ASSERT_EQ(8 * array->Blocks().size(), out.Size());

    sbp::BytesViewInput in{out.View()};
    auto loaded = Packed64SingleBlock::Create(in, array->Size(), bits);
    ASSERT_TRUE(in.IsEOF());
    ASSERT_EQ(array->Size(), loaded->Size());
    ASSERT_EQ(bits, loaded->BitsPerValue());
    ASSERT_TRUE(std::ranges::equal(array->Blocks(), loaded->Blocks()));
    AssertEqual(*loaded, values);
  }
}

TEST(packed64_single_block_tests, save_big_endian) {
  auto array = Packed64SingleBlock::Create(4, 32);
  array->Set(0, 0xFFFFFFFF);
  array->Set(1, 1);
  array->Set(2, 0x01020304);

  sbp::BytesOutput out;
  array->Save(out);

  const sbp::bstring expected{0x00, 0x00, 0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFF,
                              0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03, 0x04};
  ASSERT_EQ(expected, out.Release());
}

TEST(packed64_single_block_tests, load_truncated) {
  auto array = Packed64SingleBlock::Create(100, 9);
  SetAll(*array, GenerateValues(100, 9, 23));

  sbp::BytesOutput out;
  array->Save(out);
  const auto data = out.View();

  SimpleMemoryAccounter memory;
  ScopedLogCallback log{sbp::log::Level::kError, &CountError};
  gErrors = 0;

  sbp::BytesViewInput in{data.first(data.size() - 1)};
  ASSERT_THROW(Packed64SingleBlock::Create(in, 100, 9, memory),
               sbp::eof_error);
  ASSERT_EQ(1, gErrors);
  ASSERT_EQ(0, memory.counter_);

  in.Reset({});
  ASSERT_THROW(Packed64SingleBlock::Create(in, 100, 9), sbp::io_error);
  ASSERT_EQ(2, gErrors);

  // nothing to read
  in.Reset({});
  auto empty = Packed64SingleBlock::Create(in, 0, 9);
  ASSERT_EQ(0, empty->Size());
  ASSERT_EQ(2, gErrors);
}

TEST(packed64_single_block_tests, resource_manager) {
  SimpleMemoryAccounter memory;

  {
    auto array = Packed64SingleBlock::Create(1000, 7, memory);
    ASSERT_EQ(sizeof(uint64_t) * array->Blocks().size(), memory.counter_);

    array->Fill(0, 1000, 3);
    array->Clear();
    ASSERT_EQ(sizeof(uint64_t) * array->Blocks().size(), memory.counter_);
  }
  ASSERT_EQ(0, memory.counter_);

  memory.result_ = false;
  ASSERT_THROW(Packed64SingleBlock::Create(1000, 7, memory),
               std::runtime_error);
}

TEST(packed64_single_block_tests, memory_usage) {
  using sbp::memory::AlignObjectSize;
  using sbp::memory::SizeOfArray;

  auto empty = Packed64SingleBlock::Create(0, 4);
  ASSERT_EQ(AlignObjectSize(sizeof(Packed64SingleBlock)),
            empty->MemoryUsage());

  for (const auto bits : kSupportedBitsPerValue) {
    auto array = Packed64SingleBlock::Create(1000, bits);
    const size_t blocks = array->Blocks().size();
    ASSERT_EQ(AlignObjectSize(sizeof(Packed64SingleBlock)) +
                SizeOfArray<uint64_t>(blocks),
              array->MemoryUsage());
    ASSERT_GE(array->MemoryUsage(), blocks * sizeof(uint64_t));
    ASSERT_EQ(0, array->MemoryUsage() % sbp::memory::kObjectAlignment);
  }
}

TEST(packed64_single_block_tests, to_string) {
  ASSERT_EQ("Packed64SingleBlock<3>(bitsPerValue=3, size=25, blocks=2)",
            Packed64SingleBlock::Create(25, 3)->ToString());
  ASSERT_EQ("Packed64SingleBlock<32>(bitsPerValue=32, size=0, blocks=0)",
            Packed64SingleBlock::Create(0, 32)->ToString());
}

TEST(packed64_single_block_tests, trace_create) {
  ScopedLogCallback log{sbp::log::Level::kTrace, &CountTrace};
  gTraces = 0;

  Packed64SingleBlock::Create(10, 4);
  ASSERT_EQ(1, gTraces);

  ASSERT_THROW(Packed64SingleBlock::Create(10, 11), sbp::unsupported_width);
  ASSERT_EQ(2, gTraces);
}

TEST(packed64_single_block_tests, out_of_range_access) {
  auto array = Packed64SingleBlock::Create(25, 3);

  gAsserts = 0;
  auto* prev = sbp::assert::SetCallback(&CountAssert);
  array->Set(25, 1);
  const auto value = array->Get(25);
  sbp::assert::SetCallback(prev);

  // index 25 still maps into the second block
  ASSERT_EQ(1, value);

  ASSERT_EQ(2, gAsserts);
}
