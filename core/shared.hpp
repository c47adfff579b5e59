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

#include "types.hpp"  // sbpack types

////////////////////////////////////////////////////////////////////////////////
/// C++ standard
////////////////////////////////////////////////////////////////////////////////

#ifndef __cplusplus
#error C++ is required
#endif

#define SBPACK_CXX_20 202002L  // c++20

#if defined(_MSC_VER)
// MSVC doesn't honor __cplusplus macro,
// it always equals to 199711L
// therefore we use _MSC_VER
#if _MSC_VER < 1920  // before MSVC2019
#error "at least C++20 is required"
#endif
#else  // GCC/Clang
#if __cplusplus < SBPACK_CXX_20
#error "at least C++20 is required"
#endif
#endif

#define SBPACK_CXX SBPACK_CXX_20

////////////////////////////////////////////////////////////////////////////////
/// Export/Import definitions
////////////////////////////////////////////////////////////////////////////////

// Generic helper definitions for shared library support
#if defined _MSC_VER || defined __CYGWIN__
#define SBPACK_HELPER_DLL_IMPORT __declspec(dllimport)
#define SBPACK_HELPER_DLL_EXPORT __declspec(dllexport)
#define SBPACK_HELPER_DLL_LOCAL

#define SBP_FORCE_INLINE inline __forceinline
#define SBP_RESTRICT __restrict
#define SBP_NO_UNIQUE_ADDRESS [[msvc::no_unique_address]]
#else
#if ((defined(__GNUC__) && (__GNUC__ >= 10)) || \
     (defined(__clang__) && (__clang_major__ >= 11)))
#define SBPACK_HELPER_DLL_IMPORT __attribute__((visibility("default")))
#define SBPACK_HELPER_DLL_EXPORT __attribute__((visibility("default")))
#define SBPACK_HELPER_DLL_LOCAL __attribute__((visibility("hidden")))
#else  // before GCC10/clang11
#error "compiler is not supported"
#endif

#define SBP_FORCE_INLINE inline __attribute__((always_inline))
#define SBP_RESTRICT __restrict__
#define SBP_NO_UNIQUE_ADDRESS [[no_unique_address]]
#endif

// SBPACK_API is used for the public API symbols. It either DLL imports or
// DLL exports (or does nothing for static build)
#ifdef SBPACK_DLL
#ifdef SBPACK_DLL_EXPORTS
#define SBPACK_API SBPACK_HELPER_DLL_EXPORT
#else
#define SBPACK_API SBPACK_HELPER_DLL_IMPORT
#endif  // SBPACK_DLL_EXPORTS
#else   // SBPACK_DLL is not defined: this means SBPACK is a static lib.
#define SBPACK_API
#endif  // SBPACK_DLL

// define function name used for pretty printing
#if defined(__FUNCSIG__) || _MSC_FULL_VER >= 193000000
#define SBPACK_CURRENT_FUNCTION __FUNCSIG__
#elif defined(__PRETTY_FUNCTION__) || defined(__GNUC__) || defined(__clang__)
#define SBPACK_CURRENT_FUNCTION __PRETTY_FUNCTION__
#else
#error "compiler is not supported"
#endif

// likely/unlikely branch indicator
// macro definitions similar to the ones at
// https://kernelnewbies.org/FAQ/LikelyUnlikely
#if defined(__GNUC__) || defined(__GNUG__)
#define SBP_LIKELY(v) __builtin_expect(!!(v), 1)
#define SBP_UNLIKELY(v) __builtin_expect(!!(v), 0)
#else
#define SBP_LIKELY(v) v
#define SBP_UNLIKELY(v) v
#endif
