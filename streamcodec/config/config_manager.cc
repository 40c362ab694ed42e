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

#include "streamcodec/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <typeinfo>

#include "streamcodec/diagnostics/logger.hpp"

namespace streamcodec {
namespace config {

namespace {

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

ConfigType infer_type(const std::string& value_str) {
  if (value_str == "true" || value_str == "false") {
    return ConfigType::Boolean;
  }
  if (value_str.empty()) {
    return ConfigType::String;
  }

  const size_t start = (value_str[0] == '-') ? 1 : 0;
  if (start == value_str.size()) {
    return ConfigType::String;
  }
  const auto digits = std::count_if(value_str.begin() + static_cast<std::ptrdiff_t>(start), value_str.end(),
                                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
  const auto dots = std::count(value_str.begin(), value_str.end(), '.');
  const auto length = static_cast<std::ptrdiff_t>(value_str.size() - start);

  if (digits == length) {
    return ConfigType::Integer;
  }
  if (dots == 1 && digits == length - 1 && digits > 0) {
    return ConfigType::Double;
  }
  return ConfigType::String;
}

std::any deserialize_value(const std::string& value_str, ConfigType type) {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any(value_str);
      case ConfigType::Integer:
        return std::any(std::stoi(value_str));
      case ConfigType::Boolean:
        return std::any(value_str == "true");
      case ConfigType::Double:
        return std::any(std::stod(value_str));
    }
  } catch (const std::logic_error&) {
    // stoi / stod out of range or not a number: keep the raw text
  }
  return std::any(value_str);
}

}  // namespace

ConfigType config_type_of(const std::any& value) {
  if (value.type() == typeid(int)) return ConfigType::Integer;
  if (value.type() == typeid(bool)) return ConfigType::Boolean;
  if (value.type() == typeid(double)) return ConfigType::Double;
  return ConfigType::String;
}

std::any ConfigManager::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    throw std::out_of_range("Configuration key not found: " + key);
  }
  return it->second.value;
}

std::any ConfigManager::get(const std::string& key, const std::any& default_value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end() && it->second.value.has_value()) {
    return it->second.value;
  }
  return default_value;
}

bool ConfigManager::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.find(key) != config_items_.end();
}

ValidationResult ConfigManager::set(const std::string& key, const std::any& value) {
  std::any old_value;
  bool had_value = false;
  ConfigChangeCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto validation_result = validate_value(key, value);
    if (!validation_result.is_valid) {
      return validation_result;
    }

    auto it = config_items_.find(key);
    if (it != config_items_.end()) {
      old_value = it->second.value;
      had_value = old_value.has_value();
      it->second.value = value;
    } else {
      config_items_[key] = ConfigItem(key, value, config_type_of(value), false);
    }

    auto cb = change_callbacks_.find(key);
    if (had_value && cb != change_callbacks_.end()) {
      callback = cb->second;
    }
  }

  if (callback) {
    try {
      callback(key, old_value, value);
    } catch (const std::exception& e) {
      STREAMCODEC_LOG_ERROR("config_manager", "set",
                            "Error in change callback for key '" + key + "': " + std::string(e.what()));
    }
  }

  return ValidationResult::success();
}

bool ConfigManager::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.erase(key) > 0;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_.clear();
}

ValidationResult ConfigManager::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto& [key, item] : config_items_) {
    if (item.required && !item.value.has_value()) {
      return ValidationResult::error("Required configuration key missing value: " + key);
    }
    if (!item.value.has_value()) {
      continue;
    }
    auto result = validate_value(key, item.value);
    if (!result.is_valid) {
      return result;
    }
  }

  return ValidationResult::success();
}

ValidationResult ConfigManager::validate(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::error("Configuration key not found: " + key);
  }
  if (!it->second.value.has_value()) {
    return it->second.required ? ValidationResult::error("Required configuration key missing value: " + key)
                               : ValidationResult::success();
  }

  return validate_value(key, it->second.value);
}

void ConfigManager::register_item(const ConfigItem& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_[item.key] = item;
}

void ConfigManager::register_validator(const std::string& key, Validator validator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    it->second.validator = std::move(validator);
  }
}

void ConfigManager::on_change(const std::string& key, ConfigChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_[key] = std::move(callback);
}

void ConfigManager::remove_change_callback(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_.erase(key);
}

bool ConfigManager::save_to_file(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ofstream file(filepath);
  if (!file.is_open()) {
    STREAMCODEC_LOG_ERROR("config_manager", "save", "Cannot open configuration file for writing: " + filepath);
    return false;
  }

  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }
  std::sort(keys.begin(), keys.end());

  file << "# streamcodec configuration file\n\n";
  for (const auto& key : keys) {
    const auto& item = config_items_.at(key);
    if (!item.value.has_value()) {
      continue;
    }
    if (!item.description.empty()) {
      file << "# " << item.description << "\n";
    }
    file << key << "=" << serialize_value(item.value, item.type) << "\n";
  }

  return static_cast<bool>(file);
}

bool ConfigManager::load_from_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    STREAMCODEC_LOG_WARNING("config_manager", "load", "Cannot open configuration file: " + filepath);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const size_t pos = line.find('=');
    if (pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(line.substr(0, pos));
    const std::string value_str = trim(line.substr(pos + 1));
    if (key.empty()) {
      continue;
    }

    auto it = config_items_.find(key);
    if (it != config_items_.end()) {
      it->second.value = deserialize_value(value_str, it->second.type);
    } else {
      ConfigType type = infer_type(value_str);
      config_items_[key] = ConfigItem(key, deserialize_value(value_str, type), type, false);
    }
  }

  return true;
}

std::vector<std::string> ConfigManager::get_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());

  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }

  return keys;
}

ConfigType ConfigManager::get_type(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.type;
  }
  throw std::out_of_range("Configuration key not found: " + key);
}

std::string ConfigManager::get_description(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.description;
  }
  return "";
}

bool ConfigManager::is_required(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.required;
  }
  return false;
}

ValidationResult ConfigManager::validate_value(const std::string& key, const std::any& value) const {
  if (value.type() != typeid(std::string) && value.type() != typeid(int) && value.type() != typeid(bool) &&
      value.type() != typeid(double)) {
    return ValidationResult::error("Unsupported value type for key '" + key + "'");
  }

  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::success();
  }

  if (it->second.type != config_type_of(value)) {
    return ValidationResult::error("Type mismatch for key '" + key + "'");
  }

  if (it->second.validator) {
    return it->second.validator(value);
  }

  return ValidationResult::success();
}

std::string ConfigManager::serialize_value(const std::any& value, ConfigType type) const {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any_cast<std::string>(value);
      case ConfigType::Integer:
        return std::to_string(std::any_cast<int>(value));
      case ConfigType::Boolean:
        return std::any_cast<bool>(value) ? "true" : "false";
      case ConfigType::Double: {
        std::ostringstream oss;
        oss << std::any_cast<double>(value);
        return oss.str();
      }
    }
  } catch (const std::bad_any_cast&) {
    STREAMCODEC_LOG_WARNING("config_manager", "save", "Value does not match its declared type");
  }
  return "";
}

}  // namespace config
}  // namespace streamcodec
