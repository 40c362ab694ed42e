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

#include "streamcodec/base/visibility.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief Fresh random (version 4) UUID string, e.g. "3f2b...-..."
 *
 * Each call uses its own generator; no shared state between codecs.
 */
STREAMCODEC_API std::string generate_codec_id();

}  // namespace codec
}  // namespace streamcodec
