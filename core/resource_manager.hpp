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
#include <memory>
#include <type_traits>
#include <vector>

#include "shared.hpp"
#include "utils/misc.hpp"

namespace sbp {

// Accounting hook notified about memory taken by containers
struct SBPACK_API IResourceManager {
  static IResourceManager kNoop;

  IResourceManager() = default;
  virtual ~IResourceManager() = default;

  IResourceManager(const IResourceManager&) = delete;
  IResourceManager& operator=(const IResourceManager&) = delete;

  // throws to refuse the allocation
  virtual void Increase(size_t) {}

  virtual void Decrease(size_t) noexcept {}
};

// std::allocator reporting every allocation to an IResourceManager
template<typename T>
class ManagedTypedAllocator {
 public:
  using value_type = T;
  using propagate_on_container_move_assignment = std::true_type;
  using propagate_on_container_copy_assignment = std::true_type;
  using propagate_on_container_swap = std::true_type;

  ManagedTypedAllocator() noexcept : manager_{&IResourceManager::kNoop} {}

  explicit ManagedTypedAllocator(IResourceManager& manager) noexcept
    : manager_{&manager} {}

  template<typename U>
  ManagedTypedAllocator(const ManagedTypedAllocator<U>& other) noexcept
    : manager_{&other.Manager()} {}

  T* allocate(size_t n) {
    size_t accounted = sizeof(T) * n;
    manager_->Increase(accounted);
    Finally rollback = [&]() noexcept {
      if (accounted != 0) {
        manager_->Decrease(accounted);
      }
    };
    auto* p = std::allocator<T>{}.allocate(n);
    accounted = 0;
    return p;
  }

  void deallocate(T* p, size_t n) noexcept {
    std::allocator<T>{}.deallocate(p, n);
    manager_->Decrease(sizeof(T) * n);
  }

  IResourceManager& Manager() const noexcept { return *manager_; }

  template<typename U>
  bool operator==(const ManagedTypedAllocator<U>& other) const noexcept {
    return manager_ == &other.Manager();
  }

 private:
  IResourceManager* manager_;
};

template<typename T>
using ManagedVector = std::vector<T, ManagedTypedAllocator<T>>;

}  // namespace sbp
