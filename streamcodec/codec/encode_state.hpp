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

#include <memory>
#include <string>
#include <variant>

#include "streamcodec/codec/record.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief Encoder state: no record in flight
 */
struct Idle {};

/**
 * @brief Encoder state: record partially written
 *
 * remaining holds the characters of "text + delimiter" not yet written;
 * it is never empty while the encoder is Pending.
 */
struct Pending {
  std::shared_ptr<const Record> record;
  std::u32string remaining;
};

using EncodeState = std::variant<Idle, Pending>;

inline bool is_idle(const EncodeState& state) noexcept { return std::holds_alternative<Idle>(state); }

}  // namespace codec
}  // namespace streamcodec
