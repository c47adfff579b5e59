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

#include "utils/assert.hpp"

#include <cstdio>
#include <cstdlib>
#include <utility>

namespace sbp::assert {
namespace {

void Abort(SourceLocation&& location, std::string_view message) {
  std::fprintf(stderr, "%.*s:%zu: %.*s: Assertion failed: %.*s\n",
               static_cast<int>(location.file.size()), location.file.data(),
               location.line, static_cast<int>(location.func.size()),
               location.func.data(), static_cast<int>(message.size()),
               message.data());
  std::abort();
}

Callback gCallback = &Abort;

}  // namespace

Callback SetCallback(Callback callback) noexcept {
  return std::exchange(gCallback, callback != nullptr ? callback : &Abort);
}

void Message(SourceLocation&& location, std::string_view message) {
  gCallback(std::move(location), message);
}

}  // namespace sbp::assert
