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

#include <type_traits>
#include <utility>

#include "shared.hpp"

namespace sbp {

// Runs the given function on scope exit
template<typename Func>
class Finally {
 public:
  static_assert(std::is_nothrow_invocable_v<Func>);

  // not movable, absl::Cleanup is the movable alternative
  Finally(Finally&&) = delete;
  Finally(const Finally&) = delete;
  Finally& operator=(Finally&&) = delete;
  Finally& operator=(const Finally&) = delete;

  Finally(Func&& func) : func_{std::move(func)} {}
  ~Finally() { func_(); }

 private:
  SBP_NO_UNIQUE_ADDRESS Func func_;
};

}  // namespace sbp
