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
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

namespace streamcodec {
namespace memory {

/**
 * @brief Non-owning view over a contiguous range of elements
 *
 * Bounds-checked span for C++17 builds; stands in for std::span at the
 * codec's byte boundaries.
 */
template <typename T>
class SafeSpan {
 public:
  using element_type = T;
  using value_type = std::remove_cv_t<T>;
  using size_type = std::size_t;
  using pointer = T*;
  using reference = T&;
  using iterator = T*;

  constexpr SafeSpan() noexcept : data_(nullptr), size_(0) {}

  constexpr SafeSpan(pointer data, size_type size) noexcept : data_(data), size_(size) {}

  template <typename Container,
            typename = std::enable_if_t<std::is_convertible_v<decltype(std::declval<Container&>().data()), pointer>>>
  constexpr SafeSpan(Container& container) noexcept : data_(container.data()), size_(container.size()) {}

  template <typename Container, typename = std::enable_if_t<
                                    std::is_convertible_v<decltype(std::declval<const Container&>().data()), pointer>>>
  constexpr SafeSpan(const Container& container) noexcept : data_(container.data()), size_(container.size()) {}

  constexpr reference operator[](size_type index) const { return data_[index]; }

  constexpr reference at(size_type index) const {
    if (index >= size_) {
      throw std::out_of_range("SafeSpan index out of range");
    }
    return data_[index];
  }

  constexpr pointer data() const noexcept { return data_; }
  constexpr size_type size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

  constexpr SafeSpan<T> subspan(size_type offset, size_type count) const {
    if (offset > size_ || count > size_ - offset) {
      throw std::out_of_range("SafeSpan subspan out of range");
    }
    return SafeSpan<T>(data_ + offset, count);
  }

  constexpr SafeSpan<T> subspan(size_type offset) const {
    if (offset > size_) {
      throw std::out_of_range("SafeSpan subspan offset out of range");
    }
    return SafeSpan<T>(data_ + offset, size_ - offset);
  }

 private:
  pointer data_;
  size_type size_;
};

using ByteSpan = SafeSpan<uint8_t>;
using ConstByteSpan = SafeSpan<const uint8_t>;

/**
 * @brief View the characters of a string as bytes
 */
inline ConstByteSpan as_bytes(std::string_view text) noexcept {
  return ConstByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief View a byte range as characters
 */
inline std::string_view as_string_view(ConstByteSpan bytes) noexcept {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace memory
}  // namespace streamcodec
