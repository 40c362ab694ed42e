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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "streamcodec/base/visibility.hpp"
#include "streamcodec/memory/byte_buffer.hpp"
#include "streamcodec/memory/safe_span.hpp"

namespace streamcodec {
namespace charset {

/**
 * @brief Text encodings understood by the codec
 */
enum class Charset { Utf8, UsAscii, Iso8859_1 };

STREAMCODEC_API std::string_view charset_name(Charset charset) noexcept;

/**
 * @brief Look up a charset by name (case-insensitive, "UTF8" and "UTF-8" both accepted)
 */
STREAMCODEC_API std::optional<Charset> charset_from_name(std::string_view name);

constexpr Charset default_charset() noexcept { return Charset::Utf8; }

constexpr char32_t kReplacementCharacter = U'\uFFFD';

/**
 * @brief Decode UTF-8 into code points.
 *
 * Malformed sequences (bad lead or continuation bytes, overlong forms,
 * surrogates, values past U+10FFFF, truncated tails) are replaced with
 * U+FFFD one byte at a time. If malformed is non-null it is set to
 * whether any replacement happened.
 */
STREAMCODEC_API std::u32string decode_utf8(std::string_view text, bool* malformed = nullptr);

/**
 * @brief Encode code points as UTF-8. Invalid code points become U+FFFD.
 */
STREAMCODEC_API std::string encode_utf8(std::u32string_view text);

/**
 * @brief Decode bytes in the given charset to UTF-8 text, best effort
 */
STREAMCODEC_API std::string decode_to_utf8(Charset charset, memory::ConstByteSpan bytes);

enum class TransformStatus {
  Underflow,  // all input consumed
  Overflow,   // output buffer full before input was consumed
  Unmappable  // input[consumed] has no representation in the charset
};

struct TransformResult {
  TransformStatus status;
  size_t consumed;  // characters taken from the input
  size_t written;   // bytes put into the output
};

/**
 * @brief Resumable characters-to-bytes transform
 *
 * encode() writes whole characters only: a character whose byte form does
 * not fit in the remaining output space is left unconsumed, so the caller
 * can re-submit input.substr(consumed) against the next buffer without
 * ever splitting a multi-byte sequence.
 */
class STREAMCODEC_API CharsetEncoder {
 public:
  explicit CharsetEncoder(Charset charset = default_charset()) noexcept : charset_(charset) {}

  Charset charset() const noexcept { return charset_; }

  TransformResult encode(std::u32string_view input, memory::ByteBuffer& out) const;

  bool can_encode(char32_t ch) const noexcept;
  bool can_encode(std::u32string_view text) const noexcept;

  /**
   * @brief Number of bytes ch occupies in this charset, 0 if unmappable
   */
  size_t encoded_length(char32_t ch) const noexcept;

 private:
  Charset charset_;
};

}  // namespace charset
}  // namespace streamcodec
