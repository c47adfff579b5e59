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

#include "store/store_utils.hpp"

#include <absl/strings/str_cat.h>

#include <cstring>

#include "error/error.hpp"

namespace sbp {

void BytesViewInput::ReadBytes(byte_type* b, size_t len) {
  if (SBP_UNLIKELY(static_cast<size_t>(end() - pos_) < len)) {
    ThrowEOF(len);
  }
  if (len != 0) {
    std::memcpy(b, pos_, len);
    pos_ += len;
  }
}

void BytesViewInput::ThrowEOF(size_t requested) const {
  throw eof_error{absl::StrCat("Failed to read ", requested,
                               " byte(s) at position ", Position(),
                               ", input length is ", data_.size())};
}

}  // namespace sbp
