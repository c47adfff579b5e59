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

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "utils/assert.hpp"

// Element by element range operations over any packed integer sequence
// exposing Size(), Get(index) and Set(index, value)
namespace sbp::packed::naive {

// Returns number of values copied into 'values', at most 'count'
template<typename Ints>
size_t Get(const Ints& ints, size_t index, uint64_t* values, size_t count) {
  const size_t size = ints.Size();
  SBP_ASSERT(index <= size);
  count = std::min(count, size - std::min(index, size));

  for (size_t i = 0; i < count; ++i) {
    values[i] = ints.Get(index + i);
  }
  return count;
}

// Returns number of values taken from 'values', at most 'count'
template<typename Ints>
size_t Set(Ints& ints, size_t index, const uint64_t* values, size_t count) {
  const size_t size = ints.Size();
  SBP_ASSERT(index <= size);
  count = std::min(count, size - std::min(index, size));

  for (size_t i = 0; i < count; ++i) {
    ints.Set(index + i, values[i]);
  }
  return count;
}

template<typename Ints>
void Fill(Ints& ints, size_t from, size_t to, uint64_t value) {
  SBP_ASSERT(from <= to && to <= ints.Size());

  for (; from < to; ++from) {
    ints.Set(from, value);
  }
}

}  // namespace sbp::packed::naive
