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
#include <memory>
#include <span>
#include <string>

#include "resource_manager.hpp"
#include "shared.hpp"

namespace sbp {

class DataInput;
class DataOutput;

////////////////////////////////////////////////////////////////////////////////
/// @class Packed64SingleBlock
/// @brief fixed width integer array where every value is stored entirely
///        within one 64-bit block, i.e. values never span a block boundary
/// @note the number of values and the number of bits per value are fixed at
///       construction, storage is allocated once and zeroed
////////////////////////////////////////////////////////////////////////////////
class SBPACK_API Packed64SingleBlock {
 public:
  using ptr = std::unique_ptr<Packed64SingleBlock>;

  static bool IsSupported(uint32_t bits) noexcept;

  // throws unsupported_width if 'bits' is not supported
  static ptr Create(size_t size, uint32_t bits,
                    IResourceManager& rm = IResourceManager::kNoop);

  // Creates an array filled with 'RequiredBlocks(size)' blocks read from
  // 'in', propagates any error of the input
  static ptr Create(DataInput& in, size_t size, uint32_t bits,
                    IResourceManager& rm = IResourceManager::kNoop);

  Packed64SingleBlock(const Packed64SingleBlock&) = delete;
  Packed64SingleBlock& operator=(const Packed64SingleBlock&) = delete;

  virtual ~Packed64SingleBlock() = default;

  // 'index' must be less than Size(). This is checked by SBP_ASSERT only, so
  // an out of range index is undefined behavior in release builds.
  virtual uint64_t Get(size_t index) const noexcept = 0;

  // 'value' is truncated to BitsPerValue(). 'index' must be less than Size(),
  // as for Get, release builds do not check it.
  virtual void Set(size_t index, uint64_t value) noexcept = 0;

  // Reads at most 'count' values starting at 'index' into 'values'.
  // Returns the number of values actually read, which may be less than
  // requested, callers should call again to get the rest.
  virtual size_t Get(size_t index, uint64_t* values,
                     size_t count) const noexcept = 0;

  // Writes at most 'count' values starting at 'index', returns the number of
  // values actually written, same contract as bulk Get.
  virtual size_t Set(size_t index, const uint64_t* values,
                     size_t count) noexcept = 0;

  // Assigns 'value' to every index in [from, to), 'to' is clamped to Size()
  virtual void Fill(size_t from, size_t to, uint64_t value) noexcept = 0;

  size_t Get(size_t index, std::span<uint64_t> values) const noexcept {
    return Get(index, values.data(), values.size());
  }

  size_t Set(size_t index, std::span<const uint64_t> values) noexcept {
    return Set(index, values.data(), values.size());
  }

  void Clear() noexcept;

  size_t Size() const noexcept { return size_; }
  uint32_t BitsPerValue() const noexcept { return bits_; }
  uint32_t ValuesPerBlock() const noexcept;

  std::span<const uint64_t> Blocks() const noexcept {
    return {blocks_.data(), blocks_.size()};
  }

  // Estimated number of bytes occupied by the instance and its storage
  size_t MemoryUsage() const noexcept;

  // Writes every block in order, readable back with Create(DataInput&, ...)
  void Save(DataOutput& out) const;

  std::string ToString() const;

 protected:
  Packed64SingleBlock(size_t size, uint32_t bits, IResourceManager& rm);

  size_t size_;
  uint32_t bits_;
  ManagedVector<uint64_t> blocks_;
};

}  // namespace sbp
