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
/// @class DataOutput
/// @brief sequential sink of persisted data
/// @note fixed width integers are written in big-endian byte order
////////////////////////////////////////////////////////////////////////////////
class DataOutput {
 public:
  virtual ~DataOutput() = default;

  virtual void WriteByte(byte_type b) = 0;
  virtual void WriteBytes(const byte_type* b, size_t len) = 0;

  void WriteU64(uint64_t n) {
    byte_type buf[sizeof n];
    absl::big_endian::Store64(buf, n);
    WriteBytes(buf, sizeof buf);
  }
};

}  // namespace sbp
