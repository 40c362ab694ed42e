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

#include "streamcodec/codec/record.hpp"

#include <cstdio>
#include <ctime>

namespace streamcodec {
namespace codec {

Event::Event(std::string message) { fields_[kMessageField] = std::move(message); }

void Event::set_field(const std::string& name, std::string value) { fields_[name] = std::move(value); }

std::optional<std::string> Event::get_field(const std::string& name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Event::has_field(const std::string& name) const { return fields_.find(name) != fields_.end(); }

bool Event::remove_field(const std::string& name) { return fields_.erase(name) > 0; }

std::string Event::to_text() const {
  std::string text;
  if (timestamp_) {
    text = format_timestamp(*timestamp_);
    text.push_back(' ');
  }
  text += get_field(kHostField).value_or("%{host}");
  text.push_back(' ');
  text += get_field(kMessageField).value_or("%{message}");
  return text;
}

std::string Event::format_timestamp(Clock::time_point timestamp) {
  const auto since_epoch = timestamp.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
  auto seconds = Clock::to_time_t(timestamp);
  if (ms < 0) {
    ms += 1000;
    seconds -= 1;
  }

  std::tm time_info{};
#if defined(_WIN32)
  ::gmtime_s(&time_info, &seconds);
#else
  ::gmtime_r(&seconds, &time_info);
#endif
  char date_buf[32] = {0};
  std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%dT%H:%M:%S", &time_info);

  char result[48] = {0};
  std::snprintf(result, sizeof(result), "%s.%03dZ", date_buf, static_cast<int>(ms));
  return result;
}

}  // namespace codec
}  // namespace streamcodec
