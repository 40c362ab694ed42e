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

#include "streamcodec/diagnostics/error_handler.hpp"

#include <algorithm>

#include "streamcodec/diagnostics/logger.hpp"

namespace streamcodec {
namespace diagnostics {

ErrorHandler::ErrorHandler() = default;
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler handler;
  return handler;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load()) {
    return;
  }

  if (error.level < min_level_.load()) {
    return;
  }

  std::vector<ErrorCallback> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_stats(error);
    add_to_recent_errors(error);
    add_to_component_errors(error);
    callbacks_copy = callbacks_;
  }
  notify_callbacks(callbacks_copy, error);
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  recent_errors_.clear();
  errors_by_component_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_errors_by_component(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  if (it != errors_by_component_.end()) {
    return it->second;
  }
  return {};
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);

  size_t start_index = 0;
  if (recent_errors_.size() > count) {
    start_index = recent_errors_.size() - count;
  }

  return std::vector<ErrorInfo>(recent_errors_.begin() + static_cast<std::ptrdiff_t>(start_index),
                                recent_errors_.end());
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  return it != errors_by_component_.end() && !it->second.empty();
}

size_t ErrorHandler::get_error_count(const std::string& component, ErrorLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  if (it == errors_by_component_.end()) {
    return 0;
  }

  return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                           [level](const ErrorInfo& error) { return error.level == level; }));
}

void ErrorHandler::update_stats(const ErrorInfo& error) {
  stats_.total_errors++;
  stats_.errors_by_level[static_cast<size_t>(error.level)]++;
  stats_.errors_by_category[static_cast<size_t>(error.category)]++;

  if (stats_.first_error == std::chrono::system_clock::time_point{}) {
    stats_.first_error = error.timestamp;
  }
  stats_.last_error = error.timestamp;
}

void ErrorHandler::notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error) {
  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Logger directly, reporting here would recurse
      STREAMCODEC_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    }
  }
}

void ErrorHandler::add_to_recent_errors(const ErrorInfo& error) {
  recent_errors_.push_back(error);

  if (recent_errors_.size() > MAX_RECENT_ERRORS) {
    recent_errors_.erase(recent_errors_.begin(),
                         recent_errors_.begin() +
                             static_cast<std::ptrdiff_t>(recent_errors_.size() - MAX_RECENT_ERRORS));
  }
}

void ErrorHandler::add_to_component_errors(const ErrorInfo& error) {
  auto& component_errors = errors_by_component_[error.component];
  component_errors.push_back(error);

  if (component_errors.size() > MAX_COMPONENT_ERRORS) {
    component_errors.erase(component_errors.begin(),
                           component_errors.begin() +
                               static_cast<std::ptrdiff_t>(component_errors.size() - MAX_COMPONENT_ERRORS));
  }
}

namespace error_reporting {

void report_encode_error(const std::string& component, ErrorCode code, const std::string& message,
                         const std::string& context) {
  ErrorLevel level = code == ErrorCode::RecordOutOfOrder ? ErrorLevel::WARNING : ErrorLevel::ERROR;
  ErrorInfo error(level, ErrorCategory::ENCODING, component, "encode", message, make_error_code(code));
  error.context = context;
  ErrorHandler::instance().report_error(error);
}

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, component, operation, message,
                  make_error_code(ErrorCode::InvalidConfiguration));
  ErrorHandler::instance().report_error(error);
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::UNKNOWN, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_info(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::INFO, ErrorCategory::UNKNOWN, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace streamcodec
