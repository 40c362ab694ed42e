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

#include "streamcodec/base/error_codes.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief Outcome of one encode call
 *
 * Complete: the record and its delimiter have been fully written.
 * Partial:  output ran out; call encode again with the same record.
 * Failed:   code() says why. RecordOutOfOrder is a caller error and left
 *           the codec untouched; UnmappableCharacter is a data error and
 *           dropped the record.
 */
class EncodeResult {
 public:
  enum class Status { Complete, Partial, Failed };

  static EncodeResult complete() { return EncodeResult(Status::Complete, ErrorCode::Success, ""); }
  static EncodeResult partial() { return EncodeResult(Status::Partial, ErrorCode::Success, ""); }
  static EncodeResult failure(ErrorCode code, const std::string& message) {
    return EncodeResult(Status::Failed, code, message);
  }

  Status status() const noexcept { return status_; }
  bool ok() const noexcept { return status_ != Status::Failed; }
  bool fully_written() const noexcept { return status_ == Status::Complete; }
  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  boost::system::error_code error_code() const noexcept { return make_error_code(code_); }

  bool is_out_of_order() const noexcept { return code_ == ErrorCode::RecordOutOfOrder; }
  bool is_transform_failure() const noexcept { return code_ == ErrorCode::UnmappableCharacter; }

 private:
  EncodeResult(Status status, ErrorCode code, std::string message)
      : status_(status), code_(code), message_(std::move(message)) {}

  Status status_;
  ErrorCode code_;
  std::string message_;
};

}  // namespace codec
}  // namespace streamcodec
