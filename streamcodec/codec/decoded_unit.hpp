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

#include <functional>
#include <string>
#include <unordered_map>

namespace streamcodec {
namespace codec {

/**
 * @brief Key under which a decoded unit carries its text fragment
 */
constexpr const char* kMessageField = "message";

/**
 * @brief One decoded fragment: {"message": fragment}
 */
using DecodedUnit = std::unordered_map<std::string, std::string>;

/**
 * @brief Receives decoded units synchronously, in input order
 */
using DecodedUnitConsumer = std::function<void(DecodedUnit)>;

inline DecodedUnit make_decoded_unit(std::string fragment) {
  DecodedUnit unit;
  unit.emplace(kMessageField, std::move(fragment));
  return unit;
}

}  // namespace codec
}  // namespace streamcodec
