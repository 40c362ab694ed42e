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
#include <memory>
#include <string>
#include <string_view>

#include "streamcodec/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace streamcodec {
namespace diagnostics {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Centralized logging system
 *
 * Thread-safe, synchronous logger with console, file and callback outputs
 * and a configurable line format.
 */
class STREAMCODEC_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  /**
   * @brief Get singleton instance
   */
  static Logger& instance();

  Logger();
  ~Logger();

  /**
   * @brief Set minimum log level
   * @param level Messages below this level will be ignored
   */
  void set_level(LogLevel level);
  LogLevel get_level() const;

  void set_console_output(bool enable);

  /**
   * @brief Set file output
   * @param filename Log file path (empty string to disable file output)
   * @return false if the file could not be opened
   */
  bool set_file_output(const std::string& filename);

  /**
   * @brief Set log callback (nullptr disables callback output)
   */
  void set_callback(LogCallback callback);

  /**
   * @brief Set output destinations
   * @param outputs Bitwise OR of LogOutput flags
   */
  void set_outputs(int outputs);
  int get_outputs() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  /**
   * @brief Set log format
   * @param format Format string with placeholders: {timestamp}, {level}, {component}, {operation}, {message}
   */
  void set_format(const std::string& format);

  void flush();

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

 private:
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

STREAMCODEC_API std::string_view to_string(LogLevel level) noexcept;

/**
 * @brief Convenience macros for logging
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define STREAMCODEC_LOG_AT(lvl, method, component, operation, message)                                  \
  do {                                                                                                  \
    if (streamcodec::diagnostics::Logger::instance().get_level() <= streamcodec::diagnostics::lvl) {    \
      streamcodec::diagnostics::Logger::instance().method(component, operation, message);               \
    }                                                                                                   \
  } while (0)

#define STREAMCODEC_LOG_DEBUG(component, operation, message) \
  STREAMCODEC_LOG_AT(LogLevel::DEBUG, debug, component, operation, message)
#define STREAMCODEC_LOG_INFO(component, operation, message) \
  STREAMCODEC_LOG_AT(LogLevel::INFO, info, component, operation, message)
#define STREAMCODEC_LOG_WARNING(component, operation, message) \
  STREAMCODEC_LOG_AT(LogLevel::WARNING, warning, component, operation, message)
#define STREAMCODEC_LOG_ERROR(component, operation, message) \
  STREAMCODEC_LOG_AT(LogLevel::ERROR, error, component, operation, message)
#define STREAMCODEC_LOG_CRITICAL(component, operation, message) \
  STREAMCODEC_LOG_AT(LogLevel::CRITICAL, critical, component, operation, message)

}  // namespace diagnostics
}  // namespace streamcodec
