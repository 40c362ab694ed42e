/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

#include "streamcodec/base/visibility.hpp"

namespace streamcodec {

/**
 * @brief Structured error codes for streamcodec
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidArgument,
  InvalidConfiguration,

  // Encoder state machine
  RecordOutOfOrder,

  // Charset transform
  UnmappableCharacter
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidArgument:
      return "Invalid Argument";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::RecordOutOfOrder:
      return "Record Supplied Before Previous Record Was Fully Written";
    case ErrorCode::UnmappableCharacter:
      return "Character Not Representable In Target Charset";
    default:
      return "Unknown Error Code";
  }
}

/**
 * @brief Boost.System category for ErrorCode values
 */
STREAMCODEC_API const boost::system::error_category& codec_category() noexcept;

inline boost::system::error_code make_error_code(ErrorCode code) noexcept {
  return boost::system::error_code(static_cast<int>(code), codec_category());
}

}  // namespace streamcodec

namespace boost {
namespace system {
template <>
struct is_error_code_enum<streamcodec::ErrorCode> : std::true_type {};
}  // namespace system
}  // namespace boost
