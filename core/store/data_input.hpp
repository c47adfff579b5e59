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

#include <absl/base/internal/endian.h>

#include <cstddef>
#include <cstdint>

#include "shared.hpp"

namespace sbp {

////////////////////////////////////////////////////////////////////////////////
/// @class DataInput
/// @brief sequential source of persisted data in the format of DataOutput
/// @note implementations report failures by throwing io_error, eof_error if
///       the input is exhausted
////////////////////////////////////////////////////////////////////////////////
class DataInput {
 public:
  virtual ~DataInput() = default;

  virtual byte_type ReadByte() = 0;

  // Reads exactly 'len' bytes, nothing is consumed on failure
  virtual void ReadBytes(byte_type* b, size_t len) = 0;

  virtual size_t Position() const noexcept = 0;
  virtual size_t Length() const noexcept = 0;
  virtual bool IsEOF() const noexcept = 0;

  uint64_t ReadU64() {
    byte_type buf[sizeof(uint64_t)];
    ReadBytes(buf, sizeof buf);
    return absl::big_endian::Load64(buf);
  }
};

}  // namespace sbp
