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

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "shared.hpp"

namespace sbp {

enum class ErrorCode : uint32_t {
  no_error = 0U,
  io_error,
  eof_error,
  illegal_argument,
  unsupported_width,
  undefined_error
};

#define SBP_ERROR_CODE(class_name) \
  static constexpr ErrorCode CODE = ErrorCode::class_name

// ----------------------------------------------------------------------------
//                                                                   error_base
// ----------------------------------------------------------------------------
class SBPACK_API error_base : public std::exception {
 public:
  error_base() = default;
  explicit error_base(std::string&& error) noexcept
    : error_{std::move(error)} {}

  virtual ErrorCode code() const noexcept { return ErrorCode::undefined_error; }

  const char* what() const noexcept final { return error_.c_str(); }

 private:
  std::string error_;
};

// ----------------------------------------------------------------------------
//                                                                     io_error
// ----------------------------------------------------------------------------
class SBPACK_API io_error : public error_base {
 public:
  SBP_ERROR_CODE(io_error);

  io_error() : error_base{"I/O error."} {}
  explicit io_error(std::string&& error) noexcept
    : error_base{std::move(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                                    eof_error
// ----------------------------------------------------------------------------
class SBPACK_API eof_error : public io_error {
 public:
  SBP_ERROR_CODE(eof_error);

  eof_error() : io_error{"Read past EOF."} {}
  explicit eof_error(std::string&& error) noexcept
    : io_error{std::move(error)} {}

  ErrorCode code() const noexcept final { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                             illegal_argument
// ----------------------------------------------------------------------------
class SBPACK_API illegal_argument : public error_base {
 public:
  SBP_ERROR_CODE(illegal_argument);

  explicit illegal_argument(std::string&& error) noexcept
    : error_base{std::move(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                            unsupported_width
// ----------------------------------------------------------------------------
class SBPACK_API unsupported_width : public illegal_argument {
 public:
  SBP_ERROR_CODE(unsupported_width);

  explicit unsupported_width(uint32_t bits_per_value);

  ErrorCode code() const noexcept final { return CODE; }

  uint32_t bits_per_value() const noexcept { return bits_per_value_; }

 private:
  uint32_t bits_per_value_;
};

}  // namespace sbp
