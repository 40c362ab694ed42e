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
#include <vector>

#include "streamcodec/base/visibility.hpp"
#include "streamcodec/config/codec_config.hpp"
#include "streamcodec/config/iconfig_manager.hpp"

namespace streamcodec {
namespace config {

/**
 * @brief Options recognized by the delimiter codec, with defaults
 *
 * - delimiter (String, ","): separator for decode-splitting and encode-joining
 * - charset (String, "UTF-8"): one of UTF-8, US-ASCII, ISO-8859-1
 */
STREAMCODEC_API std::vector<ConfigItem> codec_config_schema();

/**
 * @brief Register the codec schema (defaults and validators) into a manager
 */
STREAMCODEC_API void register_codec_schema(ConfigManagerInterface& config);

/**
 * @brief Build a CodecConfig from manager values, defaults for absent keys
 * @throws diagnostics::ConfigurationException on mistyped or invalid values
 */
STREAMCODEC_API CodecConfig codec_config_from(const ConfigManagerInterface& config);

/**
 * @brief Load a CodecConfig from a YAML document with optional
 *        "delimiter" and "charset" scalar keys
 * @throws diagnostics::ConfigurationException if the file cannot be read or parsed,
 *         or holds invalid values
 */
STREAMCODEC_API CodecConfig load_codec_config_from_yaml(const std::string& path);
STREAMCODEC_API CodecConfig parse_codec_config_yaml(const std::string& yaml_text);

}  // namespace config
}  // namespace streamcodec
