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

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "streamcodec/base/visibility.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief A structured value the codec can serialize
 *
 * The codec never looks inside a record; it only writes to_text()
 * followed by the delimiter. Records are handed to the encoder as
 * std::shared_ptr<const Record> and compared by identity.
 */
class STREAMCODEC_API Record {
 public:
  virtual ~Record() = default;

  /**
   * @brief Stable, complete UTF-8 textual form
   */
  virtual std::string to_text() const = 0;
};

/**
 * @brief Record whose textual form is a fixed string
 */
class STREAMCODEC_API TextRecord : public Record {
 public:
  explicit TextRecord(std::string text) : text_(std::move(text)) {}

  std::string to_text() const override { return text_; }

 private:
  std::string text_;
};

/**
 * @brief Pipeline event: named string fields plus an optional timestamp
 *
 * Textual form is "<timestamp> <host> <message>". A missing host or message
 * renders as the placeholder "%{host}" / "%{message}"; the timestamp part
 * (ISO-8601 UTC with milliseconds) is left out when no timestamp is set.
 */
class STREAMCODEC_API Event : public Record {
 public:
  using Clock = std::chrono::system_clock;

  static constexpr const char* kMessageField = "message";
  static constexpr const char* kHostField = "host";

  Event() = default;
  explicit Event(std::string message);

  void set_field(const std::string& name, std::string value);
  std::optional<std::string> get_field(const std::string& name) const;
  bool has_field(const std::string& name) const;
  bool remove_field(const std::string& name);
  const std::map<std::string, std::string>& fields() const noexcept { return fields_; }

  void set_timestamp(Clock::time_point timestamp) { timestamp_ = timestamp; }
  void clear_timestamp() { timestamp_.reset(); }
  const std::optional<Clock::time_point>& timestamp() const noexcept { return timestamp_; }

  std::string to_text() const override;

  /**
   * @brief ISO-8601 UTC rendering, e.g. 2024-01-02T03:04:05.006Z
   */
  static std::string format_timestamp(Clock::time_point timestamp);

 private:
  std::map<std::string, std::string> fields_;
  std::optional<Clock::time_point> timestamp_;
};

}  // namespace codec
}  // namespace streamcodec
