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

#include <benchmark/benchmark.h>

#include <random>
#include <vector>

#include "utils/bit_packing.hpp"
#include "utils/packed64_single_block.hpp"

namespace {

constexpr size_t kSize = 1 << 16;

sbp::Packed64SingleBlock::ptr MakeArray(uint32_t bits) {
  auto array = sbp::Packed64SingleBlock::Create(kSize, bits);
  std::mt19937_64 gen{bits};
  for (size_t i = 0; i < kSize; ++i) {
    array->Set(i, gen());
  }
  return array;
}

void BM_GetSingle(benchmark::State& state) {
  const auto array = MakeArray(static_cast<uint32_t>(state.range(0)));
  for (auto _ : state) {
    uint64_t sum = 0;
    for (size_t i = 0; i < kSize; ++i) {
      sum += array->Get(i);
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() * kSize);
}

void BM_GetBulk(benchmark::State& state) {
  const auto array = MakeArray(static_cast<uint32_t>(state.range(0)));
  std::vector<uint64_t> values(kSize);
  for (auto _ : state) {
    for (size_t read = 0; read < kSize;) {
      read += array->Get(read, values.data() + read, kSize - read);
    }
    benchmark::DoNotOptimize(values.data());
  }
  state.SetItemsProcessed(state.iterations() * kSize);
}

void BM_SetSingle(benchmark::State& state) {
  const auto array = MakeArray(static_cast<uint32_t>(state.range(0)));
  for (auto _ : state) {
    for (size_t i = 0; i < kSize; ++i) {
      array->Set(i, i);
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * kSize);
}

void BM_SetBulk(benchmark::State& state) {
  const auto array = MakeArray(static_cast<uint32_t>(state.range(0)));
  std::vector<uint64_t> values(kSize);
  for (size_t i = 0; i < kSize; ++i) {
    values[i] = i;
  }
  for (auto _ : state) {
    for (size_t written = 0; written < kSize;) {
      written +=
        array->Set(written, values.data() + written, kSize - written);
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * kSize);
}

void BM_Fill(benchmark::State& state) {
  const auto array = MakeArray(static_cast<uint32_t>(state.range(0)));
  uint64_t value = 0;
  for (auto _ : state) {
    // unaligned bounds to exercise head and tail
    array->Fill(3, kSize - 5, ++value);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * kSize);
}

void SupportedBits(benchmark::internal::Benchmark* b) {
  for (const auto bits : sbp::packed::kSupportedBitsPerValue) {
    b->Arg(bits);
  }
}

}  // namespace

BENCHMARK(BM_GetSingle)->Apply(SupportedBits);
BENCHMARK(BM_GetBulk)->Apply(SupportedBits);
BENCHMARK(BM_SetSingle)->Apply(SupportedBits);
BENCHMARK(BM_SetBulk)->Apply(SupportedBits);
BENCHMARK(BM_Fill)->Apply(SupportedBits);
