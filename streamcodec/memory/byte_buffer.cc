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

#include "streamcodec/memory/byte_buffer.hpp"

#include <algorithm>
#include <stdexcept>

namespace streamcodec {
namespace memory {

ByteBuffer::ByteBuffer(size_t capacity) : data_(capacity), position_(0), limit_(capacity) {}

ByteBuffer ByteBuffer::wrap(ConstByteSpan data) {
  ByteBuffer buffer(data.size());
  std::copy(data.begin(), data.end(), buffer.data_.begin());
  return buffer;
}

ByteBuffer ByteBuffer::wrap(std::string_view data) { return wrap(as_bytes(data)); }

void ByteBuffer::set_position(size_t position) {
  if (position > limit_) {
    throw std::out_of_range("ByteBuffer position beyond limit");
  }
  position_ = position;
}

void ByteBuffer::set_limit(size_t limit) {
  if (limit > data_.size()) {
    throw std::out_of_range("ByteBuffer limit beyond capacity");
  }
  limit_ = limit;
  if (position_ > limit_) {
    position_ = limit_;
  }
}

void ByteBuffer::flip() noexcept {
  limit_ = position_;
  position_ = 0;
}

void ByteBuffer::clear() noexcept {
  position_ = 0;
  limit_ = data_.size();
}

void ByteBuffer::put(uint8_t byte) {
  if (position_ >= limit_) {
    throw std::overflow_error("ByteBuffer overflow");
  }
  data_[position_++] = byte;
}

void ByteBuffer::put(ConstByteSpan bytes) {
  if (bytes.size() > remaining()) {
    throw std::overflow_error("ByteBuffer overflow");
  }
  std::copy(bytes.begin(), bytes.end(), data_.begin() + static_cast<std::ptrdiff_t>(position_));
  position_ += bytes.size();
}

uint8_t ByteBuffer::get() {
  if (position_ >= limit_) {
    throw std::underflow_error("ByteBuffer underflow");
  }
  return data_[position_++];
}

void ByteBuffer::skip(size_t count) {
  if (count > remaining()) {
    throw std::out_of_range("ByteBuffer skip beyond limit");
  }
  position_ += count;
}

ConstByteSpan ByteBuffer::remaining_span() const noexcept {
  return ConstByteSpan(data_.data() + position_, remaining());
}

ByteSpan ByteBuffer::remaining_span() noexcept { return ByteSpan(data_.data() + position_, remaining()); }

std::string ByteBuffer::remaining_string() const {
  return std::string(reinterpret_cast<const char*>(data_.data() + position_), remaining());
}

}  // namespace memory
}  // namespace streamcodec
