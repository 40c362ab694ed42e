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

#include "streamcodec/config/codec_config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <any>
#include <optional>

#include "streamcodec/diagnostics/error_handler.hpp"
#include "streamcodec/diagnostics/exceptions.hpp"
#include "streamcodec/diagnostics/logger.hpp"

namespace streamcodec {
namespace config {

namespace {

using diagnostics::ConfigurationException;

charset::Charset parse_charset(const std::string& name, const std::string& operation) {
  auto cs = charset::charset_from_name(name);
  if (!cs) {
    diagnostics::error_reporting::report_configuration_error("config", operation, "Unsupported charset: " + name);
    throw ConfigurationException("Unsupported charset: " + name, kCharsetKey, operation);
  }
  return *cs;
}

CodecConfig checked(CodecConfig config, const std::string& operation) {
  std::string error = config.validation_error();
  if (!error.empty()) {
    diagnostics::error_reporting::report_configuration_error("config", operation, error);
    throw ConfigurationException(error, kDelimiterKey, operation);
  }
  return config;
}

std::string string_value(const ConfigManagerInterface& config, const char* key, const std::string& fallback) {
  std::any value = config.get(key, std::any(fallback));
  try {
    return std::any_cast<std::string>(value);
  } catch (const std::bad_any_cast&) {
    diagnostics::error_reporting::report_configuration_error("config", "read", std::string(key) + " must be a string");
    throw ConfigurationException("Value must be a string", key, "read");
  }
}

CodecConfig from_yaml_node(const YAML::Node& root, const std::string& operation) {
  CodecConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    diagnostics::error_reporting::report_configuration_error("config", operation,
                                                             "Codec configuration must be a YAML mapping");
    throw ConfigurationException("Codec configuration must be a YAML mapping", "", operation);
  }

  try {
    if (root[kDelimiterKey]) {
      config.delimiter = root[kDelimiterKey].as<std::string>();
    }
    if (root[kCharsetKey]) {
      config.charset = parse_charset(root[kCharsetKey].as<std::string>(), operation);
    }
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", operation,
                                                             std::string("Invalid value: ") + e.what());
    throw ConfigurationException(std::string("Invalid codec configuration value: ") + e.what(), "", operation);
  }

  return checked(std::move(config), operation);
}

}  // namespace

std::vector<ConfigItem> codec_config_schema() {
  std::vector<ConfigItem> schema;

  ConfigItem delimiter(kDelimiterKey, std::string(kDefaultDelimiter), ConfigType::String, false,
                       "Separator used for both decode-splitting and encode-joining");
  delimiter.validator = [](const std::any& value) {
    const auto* text = std::any_cast<std::string>(&value);
    if (!text) {
      return ValidationResult::error("delimiter must be a string");
    }
    CodecConfig candidate;
    candidate.delimiter = *text;
    std::string error = candidate.validation_error();
    return error.empty() ? ValidationResult::success() : ValidationResult::error(error);
  };
  schema.push_back(delimiter);

  ConfigItem cs(kCharsetKey, std::string(charset::charset_name(charset::default_charset())), ConfigType::String,
                false, "Text encoding used for decode and encode (UTF-8, US-ASCII, ISO-8859-1)");
  cs.validator = [](const std::any& value) {
    const auto* text = std::any_cast<std::string>(&value);
    if (!text || !charset::charset_from_name(*text)) {
      return ValidationResult::error("charset must be one of UTF-8, US-ASCII, ISO-8859-1");
    }
    return ValidationResult::success();
  };
  schema.push_back(cs);

  return schema;
}

void register_codec_schema(ConfigManagerInterface& config) {
  for (const auto& item : codec_config_schema()) {
    config.register_item(item);
  }
}

CodecConfig codec_config_from(const ConfigManagerInterface& config) {
  CodecConfig result;
  result.delimiter = string_value(config, kDelimiterKey, kDefaultDelimiter);
  result.charset = parse_charset(
      string_value(config, kCharsetKey, std::string(charset::charset_name(charset::default_charset()))), "read");
  return checked(std::move(result), "read");
}

CodecConfig load_codec_config_from_yaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", "load_yaml", path + ": " + e.what());
    throw ConfigurationException("Cannot load codec configuration from " + path + ": " + e.what(), "", "load_yaml");
  }

  CodecConfig config = from_yaml_node(root, "load_yaml");
  STREAMCODEC_LOG_INFO("config", "load_yaml", "Loaded codec configuration from " + path);
  return config;
}

CodecConfig parse_codec_config_yaml(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", "parse_yaml", e.what());
    throw ConfigurationException(std::string("Cannot parse codec configuration: ") + e.what(), "", "parse_yaml");
  }
  return from_yaml_node(root, "parse_yaml");
}

}  // namespace config
}  // namespace streamcodec
