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

#include <stdexcept>
#include <string>

#include "streamcodec/base/error_codes.hpp"

namespace streamcodec {
namespace diagnostics {

/**
 * @brief Base exception class for all streamcodec exceptions
 *
 * Carries the component and operation that raised it.
 */
class StreamcodecException : public std::runtime_error {
 public:
  explicit StreamcodecException(const std::string& message, const std::string& component = "",
                                const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Thrown by the throwing encode variant
 *
 * code() tells caller misuse (RecordOutOfOrder) apart from data problems
 * (UnmappableCharacter).
 */
class EncodeException : public StreamcodecException {
 public:
  EncodeException(ErrorCode code, const std::string& message, const std::string& component = "")
      : StreamcodecException(message, component, "encode"), code_(code) {}

  ErrorCode code() const noexcept { return code_; }
  boost::system::error_code error_code() const noexcept { return make_error_code(code_); }

 private:
  ErrorCode code_;
};

/**
 * @brief Thrown when codec settings are missing, mistyped or invalid
 */
class ConfigurationException : public StreamcodecException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_key = "",
                                  const std::string& operation = "")
      : StreamcodecException(message, "configuration", operation), config_key_(config_key) {}

  const std::string& get_config_key() const noexcept { return config_key_; }

  std::string get_full_message() const {
    std::string full_msg = StreamcodecException::get_full_message();
    if (!config_key_.empty()) {
      full_msg += " (key: " + config_key_ + ")";
    }
    return full_msg;
  }

 private:
  std::string config_key_;
};

}  // namespace diagnostics
}  // namespace streamcodec
