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

#include <string>

#include "streamcodec/charset/charset.hpp"

namespace streamcodec {
namespace config {

constexpr const char* kDelimiterKey = "delimiter";
constexpr const char* kCharsetKey = "charset";
constexpr const char* kDefaultDelimiter = ",";

/**
 * @brief Immutable settings shared by a codec and its clones
 */
struct CodecConfig {
  // Separator used both to split decode input and to terminate encoded records
  std::string delimiter = kDefaultDelimiter;
  charset::Charset charset = charset::default_charset();

  CodecConfig() = default;
  explicit CodecConfig(std::string delim, charset::Charset cs = charset::default_charset())
      : delimiter(std::move(delim)), charset(cs) {}

  /**
   * @brief Reason this config is unusable, empty if it is valid
   */
  std::string validation_error() const {
    if (delimiter.empty()) {
      return "delimiter must not be empty";
    }
    bool malformed = false;
    const std::u32string chars = charset::decode_utf8(delimiter, &malformed);
    if (malformed) {
      return "delimiter is not valid UTF-8";
    }
    if (!charset::CharsetEncoder(charset).can_encode(chars)) {
      return "delimiter is not representable in " + std::string(charset::charset_name(charset));
    }
    return "";
  }

  bool is_valid() const { return validation_error().empty(); }

  bool operator==(const CodecConfig& other) const {
    return delimiter == other.delimiter && charset == other.charset;
  }
  bool operator!=(const CodecConfig& other) const { return !(*this == other); }
};

}  // namespace config
}  // namespace streamcodec
