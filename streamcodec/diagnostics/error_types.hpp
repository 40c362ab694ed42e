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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace streamcodec {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message
  WARNING = 1,  // Caller misuse that left no damage behind
  ERROR = 2,    // Operation failed
  CRITICAL = 3  // Unrecoverable
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  ENCODING = 0,       // Record to bytes
  DECODING = 1,       // Bytes to decoded units
  CONFIGURATION = 2,  // Invalid codec settings
  SYSTEM = 3,         // OS / environment
  UNKNOWN = 4
};

constexpr size_t kErrorLevelCount = 4;
constexpr size_t kErrorCategoryCount = 5;

/**
 * @brief Error information passed to the error handler
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // e.g. "delimiter_codec", "config"
  std::string operation;  // e.g. "encode", "load_yaml"
  std::string message;
  boost::system::error_code error;
  std::chrono::system_clock::time_point timestamp;
  std::string context;  // codec id, config path, ...

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l), category(c), component(comp), operation(op), message(msg), timestamp(std::chrono::system_clock::now()) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        error(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_timestamp_string() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;

    std::tm time_info{};
#if defined(_WIN32)
    ::localtime_s(&time_info, &time_t);
#else
    ::localtime_r(&time_t, &time_info);
#endif
    std::ostringstream oss;
    oss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::ENCODING:
        return "ENCODING";
      case ErrorCategory::DECODING:
        return "DECODING";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  /**
   * @brief One-line summary: [LEVEL] [component] [operation] message (code)
   */
  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] " << message;

    if (error) {
      oss << " (" << error.category().name() << ": " << error.message() << ", code: " << error.value() << ")";
    }

    if (!context.empty()) {
      oss << " {" << context << "}";
    }

    return oss.str();
  }
};

/**
 * @brief Error statistics for monitoring
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[kErrorLevelCount] = {0, 0, 0, 0};
  size_t errors_by_category[kErrorCategoryCount] = {0, 0, 0, 0, 0};

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace streamcodec
