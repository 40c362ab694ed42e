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

#include "streamcodec/charset/charset.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace streamcodec {
namespace charset {

namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;

bool is_surrogate(char32_t ch) noexcept { return ch >= 0xD800 && ch <= 0xDFFF; }

bool is_valid_code_point(char32_t ch) noexcept { return ch <= kMaxCodePoint && !is_surrogate(ch); }

size_t utf8_length(char32_t ch) noexcept {
  if (!is_valid_code_point(ch)) return 0;
  if (ch < 0x80) return 1;
  if (ch < 0x800) return 2;
  if (ch < 0x10000) return 3;
  return 4;
}

// Writes the UTF-8 form of a valid code point, returns the byte count
size_t write_utf8(char32_t ch, std::array<uint8_t, 4>& out) noexcept {
  size_t len = utf8_length(ch);
  switch (len) {
    case 1:
      out[0] = static_cast<uint8_t>(ch);
      break;
    case 2:
      out[0] = static_cast<uint8_t>(0xC0 | (ch >> 6));
      out[1] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
      break;
    case 3:
      out[0] = static_cast<uint8_t>(0xE0 | (ch >> 12));
      out[1] = static_cast<uint8_t>(0x80 | ((ch >> 6) & 0x3F));
      out[2] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
      break;
    case 4:
      out[0] = static_cast<uint8_t>(0xF0 | (ch >> 18));
      out[1] = static_cast<uint8_t>(0x80 | ((ch >> 12) & 0x3F));
      out[2] = static_cast<uint8_t>(0x80 | ((ch >> 6) & 0x3F));
      out[3] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
      break;
    default:
      break;
  }
  return len;
}

void append_utf8(char32_t ch, std::string& out) {
  std::array<uint8_t, 4> bytes{};
  size_t len = write_utf8(is_valid_code_point(ch) ? ch : kReplacementCharacter, bytes);
  out.append(reinterpret_cast<const char*>(bytes.data()), len);
}

std::string normalize_name(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    if (c == '-' || c == '_') continue;
    result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return result;
}

}  // namespace

std::string_view charset_name(Charset charset) noexcept {
  switch (charset) {
    case Charset::Utf8:
      return "UTF-8";
    case Charset::UsAscii:
      return "US-ASCII";
    case Charset::Iso8859_1:
      return "ISO-8859-1";
  }
  return "UNKNOWN";
}

std::optional<Charset> charset_from_name(std::string_view name) {
  const std::string key = normalize_name(name);
  if (key == "UTF8") return Charset::Utf8;
  if (key == "USASCII" || key == "ASCII") return Charset::UsAscii;
  if (key == "ISO88591" || key == "LATIN1") return Charset::Iso8859_1;
  return std::nullopt;
}

std::u32string decode_utf8(std::string_view text, bool* malformed) {
  std::u32string result;
  result.reserve(text.size());
  bool replaced = false;

  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80) {
      result.push_back(lead);
      ++i;
      continue;
    }

    size_t len = 0;
    char32_t ch = 0;
    char32_t min_value = 0;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
      ch = lead & 0x1F;
      min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      ch = lead & 0x0F;
      min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      ch = lead & 0x07;
      min_value = 0x10000;
    }

    bool valid = len != 0 && i + len <= text.size();
    for (size_t k = 1; valid && k < len; ++k) {
      const auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      ch = (ch << 6) | (cont & 0x3F);
    }

    if (valid && ch >= min_value && is_valid_code_point(ch)) {
      result.push_back(ch);
      i += len;
    } else {
      result.push_back(kReplacementCharacter);
      replaced = true;
      ++i;
    }
  }

  if (malformed) {
    *malformed = replaced;
  }
  return result;
}

std::string encode_utf8(std::u32string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char32_t ch : text) {
    append_utf8(ch, result);
  }
  return result;
}

std::string decode_to_utf8(Charset charset, memory::ConstByteSpan bytes) {
  switch (charset) {
    case Charset::Utf8:
      return encode_utf8(decode_utf8(memory::as_string_view(bytes)));
    case Charset::UsAscii: {
      std::string result;
      result.reserve(bytes.size());
      for (uint8_t b : bytes) {
        append_utf8(b < 0x80 ? static_cast<char32_t>(b) : kReplacementCharacter, result);
      }
      return result;
    }
    case Charset::Iso8859_1: {
      std::string result;
      result.reserve(bytes.size());
      for (uint8_t b : bytes) {
        append_utf8(static_cast<char32_t>(b), result);
      }
      return result;
    }
  }
  return std::string();
}

size_t CharsetEncoder::encoded_length(char32_t ch) const noexcept {
  switch (charset_) {
    case Charset::Utf8:
      return utf8_length(ch);
    case Charset::UsAscii:
      return ch < 0x80 ? 1 : 0;
    case Charset::Iso8859_1:
      return ch < 0x100 ? 1 : 0;
  }
  return 0;
}

bool CharsetEncoder::can_encode(char32_t ch) const noexcept { return encoded_length(ch) != 0; }

bool CharsetEncoder::can_encode(std::u32string_view text) const noexcept {
  return std::all_of(text.begin(), text.end(), [this](char32_t ch) { return can_encode(ch); });
}

TransformResult CharsetEncoder::encode(std::u32string_view input, memory::ByteBuffer& out) const {
  TransformResult result{TransformStatus::Underflow, 0, 0};
  std::array<uint8_t, 4> bytes{};

  while (result.consumed < input.size()) {
    const char32_t ch = input[result.consumed];
    const size_t len = encoded_length(ch);
    if (len == 0) {
      result.status = TransformStatus::Unmappable;
      return result;
    }
    if (len > out.remaining()) {
      result.status = TransformStatus::Overflow;
      return result;
    }

    if (charset_ == Charset::Utf8) {
      write_utf8(ch, bytes);
    } else {
      bytes[0] = static_cast<uint8_t>(ch);
    }
    out.put(memory::ConstByteSpan(bytes.data(), len));
    result.written += len;
    ++result.consumed;
  }

  return result;
}

}  // namespace charset
}  // namespace streamcodec
