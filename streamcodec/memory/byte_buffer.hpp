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
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "streamcodec/base/visibility.hpp"
#include "streamcodec/memory/safe_span.hpp"

namespace streamcodec {
namespace memory {

/**
 * @brief Fixed-capacity byte buffer with a read/write cursor
 *
 * Follows the host buffer contract used at the codec boundary:
 * 0 <= position <= limit <= capacity. In write mode the region
 * [position, limit) is free space; after flip() the region
 * [position, limit) holds the bytes to be read.
 */
class STREAMCODEC_API ByteBuffer {
 public:
  explicit ByteBuffer(size_t capacity);

  /**
   * @brief Create a buffer holding a copy of data, ready for reading
   */
  static ByteBuffer wrap(ConstByteSpan data);
  static ByteBuffer wrap(std::string_view data);

  ByteBuffer(const ByteBuffer&) = default;
  ByteBuffer& operator=(const ByteBuffer&) = default;
  ByteBuffer(ByteBuffer&&) noexcept = default;
  ByteBuffer& operator=(ByteBuffer&&) noexcept = default;
  ~ByteBuffer() = default;

  size_t capacity() const noexcept { return data_.size(); }
  size_t position() const noexcept { return position_; }
  size_t limit() const noexcept { return limit_; }
  size_t remaining() const noexcept { return limit_ - position_; }
  bool has_remaining() const noexcept { return position_ < limit_; }

  void set_position(size_t position);
  void set_limit(size_t limit);

  /**
   * @brief Switch from writing to reading: limit = position, position = 0
   */
  void flip() noexcept;

  /**
   * @brief Make the whole capacity writable again: position = 0, limit = capacity
   */
  void clear() noexcept;

  void put(uint8_t byte);
  void put(ConstByteSpan bytes);
  uint8_t get();

  /**
   * @brief Advance position by count bytes
   */
  void skip(size_t count);

  /**
   * @brief Bytes in [position, limit)
   */
  ConstByteSpan remaining_span() const noexcept;
  ByteSpan remaining_span() noexcept;

  /**
   * @brief Copy of the bytes in [position, limit) as a string
   */
  std::string remaining_string() const;

 private:
  std::vector<uint8_t> data_;
  size_t position_ = 0;
  size_t limit_ = 0;
};

}  // namespace memory
}  // namespace streamcodec
