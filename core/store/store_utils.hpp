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

#include <utility>

#include "shared.hpp"
#include "store/data_input.hpp"
#include "store/data_output.hpp"

namespace sbp {

// Reads from a non-owned memory region, throws eof_error instead of reading
// past the end of the region
class SBPACK_API BytesViewInput final : public DataInput {
 public:
  BytesViewInput() = default;
  explicit BytesViewInput(bytes_view data) noexcept
    : data_{data}, pos_{data_.data()} {}

  byte_type ReadByte() final {
    if (SBP_UNLIKELY(pos_ >= end())) {
      ThrowEOF(1);
    }
    return *pos_++;
  }

  void ReadBytes(byte_type* b, size_t len) final;

  size_t Position() const noexcept final { return pos_ - data_.data(); }

  size_t Length() const noexcept final { return data_.size(); }

  bool IsEOF() const noexcept final { return pos_ >= end(); }

  void Reset(bytes_view data) noexcept {
    data_ = data;
    pos_ = data_.data();
  }

 private:
  const byte_type* end() const noexcept { return data_.data() + data_.size(); }

  [[noreturn]] void ThrowEOF(size_t requested) const;

  bytes_view data_;
  const byte_type* pos_{data_.data()};
};

// Appends everything written to an owned byte buffer
class SBPACK_API BytesOutput final : public DataOutput {
 public:
  BytesOutput() = default;

  void WriteByte(byte_type b) final { buf_.push_back(b); }

  void WriteBytes(const byte_type* b, size_t len) final {
    buf_.insert(buf_.end(), b, b + len);
  }

  bytes_view View() const noexcept { return {buf_.data(), buf_.size()}; }

  size_t Size() const noexcept { return buf_.size(); }

  void Reset() noexcept { buf_.clear(); }

  bstring Release() noexcept { return std::move(buf_); }

 private:
  bstring buf_;
};

}  // namespace sbp
