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

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "streamcodec/diagnostics/error_handler.hpp"
#include "streamcodec/diagnostics/exceptions.hpp"
#include "streamcodec/diagnostics/logger.hpp"

using namespace streamcodec;
using namespace streamcodec::diagnostics;

class ErrorHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    handler().set_enabled(true);
    handler().set_min_error_level(ErrorLevel::INFO);
    handler().clear_callbacks();
    handler().reset_stats();
  }

  void TearDown() override {
    handler().clear_callbacks();
    handler().set_min_error_level(ErrorLevel::INFO);
    handler().set_enabled(true);
    handler().reset_stats();
  }

  static ErrorHandler& handler() { return ErrorHandler::instance(); }
};

// ============================================================================
// REPORTING AND STATISTICS
// ============================================================================

TEST_F(ErrorHandlerTest, EncodeErrorLevels) {
  error_reporting::report_encode_error("delimiter_codec", ErrorCode::RecordOutOfOrder, "out of order", "id-1");
  error_reporting::report_encode_error("delimiter_codec", ErrorCode::UnmappableCharacter, "bad char", "id-1");

  EXPECT_EQ(handler().get_error_count("delimiter_codec", ErrorLevel::WARNING), 1u);
  EXPECT_EQ(handler().get_error_count("delimiter_codec", ErrorLevel::ERROR), 1u);

  auto errors = handler().get_errors_by_component("delimiter_codec");
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].category, ErrorCategory::ENCODING);
  EXPECT_EQ(errors[0].operation, "encode");
  EXPECT_EQ(errors[0].context, "id-1");
  EXPECT_EQ(errors[0].error, make_error_code(ErrorCode::RecordOutOfOrder));
  EXPECT_EQ(errors[1].error, make_error_code(ErrorCode::UnmappableCharacter));
}

TEST_F(ErrorHandlerTest, StatisticsByLevelAndCategory) {
  error_reporting::report_configuration_error("config", "load_yaml", "missing file");
  error_reporting::report_warning("codec", "decode", "odd input");
  error_reporting::report_info("codec", "clone", "cloned");

  ErrorStats stats = handler().get_error_stats();
  EXPECT_EQ(stats.total_errors, 3u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::ERROR)], 1u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::WARNING)], 1u);
  EXPECT_EQ(stats.errors_by_level[static_cast<size_t>(ErrorLevel::INFO)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::CONFIGURATION)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<size_t>(ErrorCategory::UNKNOWN)], 2u);
  EXPECT_LE(stats.first_error, stats.last_error);

  handler().reset_stats();
  EXPECT_EQ(handler().get_error_stats().total_errors, 0u);
  EXPECT_FALSE(handler().has_errors("config"));
  EXPECT_TRUE(handler().get_recent_errors().empty());
}

TEST_F(ErrorHandlerTest, MinimumLevelFilters) {
  handler().set_min_error_level(ErrorLevel::ERROR);
  EXPECT_EQ(handler().get_min_error_level(), ErrorLevel::ERROR);

  error_reporting::report_warning("codec", "encode", "ignored");
  error_reporting::report_encode_error("codec", ErrorCode::UnmappableCharacter, "kept");

  EXPECT_EQ(handler().get_error_stats().total_errors, 1u);
  EXPECT_EQ(handler().get_error_count("codec", ErrorLevel::WARNING), 0u);
}

TEST_F(ErrorHandlerTest, DisabledHandlerDropsReports) {
  handler().set_enabled(false);
  EXPECT_FALSE(handler().is_enabled());
  error_reporting::report_encode_error("codec", ErrorCode::Unknown, "dropped");
  EXPECT_FALSE(handler().has_errors("codec"));
}

TEST_F(ErrorHandlerTest, RecentErrorsKeepNewest) {
  for (int i = 0; i < 5; ++i) {
    error_reporting::report_info("codec", "decode", "event " + std::to_string(i));
  }

  auto recent = handler().get_recent_errors(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].message, "event 3");
  EXPECT_EQ(recent[1].message, "event 4");
  EXPECT_EQ(handler().get_recent_errors(100).size(), 5u);
}

// ============================================================================
// CALLBACKS
// ============================================================================

TEST_F(ErrorHandlerTest, CallbacksReceiveErrors) {
  std::vector<std::string> seen;
  handler().register_callback([&seen](const ErrorInfo& info) { seen.push_back(info.get_summary()); });

  error_reporting::report_encode_error("delimiter_codec", ErrorCode::RecordOutOfOrder, "second record", "abc");

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_NE(seen[0].find("[WARNING] [delimiter_codec] [encode] second record"), std::string::npos);
  EXPECT_NE(seen[0].find("streamcodec"), std::string::npos);
  EXPECT_NE(seen[0].find("{abc}"), std::string::npos);
}

TEST_F(ErrorHandlerTest, ThrowingCallbackDoesNotStopOthers) {
  int calls = 0;
  handler().register_callback([](const ErrorInfo&) { throw std::runtime_error("callback failure"); });
  handler().register_callback([&calls](const ErrorInfo&) { ++calls; });

  auto& logger = Logger::instance();
  const int outputs = logger.get_outputs();
  logger.set_outputs(0);
  EXPECT_NO_THROW(error_reporting::report_warning("codec", "encode", "warn"));
  logger.set_outputs(outputs);

  EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, ConcurrentReports) {
  constexpr int kThreads = 4;
  constexpr int kReports = 50;
  std::atomic<int> callbacks{0};
  handler().register_callback([&callbacks](const ErrorInfo&) { ++callbacks; });

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < kReports; ++i) {
        error_reporting::report_info("worker-" + std::to_string(t), "encode", "report");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(handler().get_error_stats().total_errors, static_cast<size_t>(kThreads * kReports));
  EXPECT_EQ(callbacks.load(), kThreads * kReports);
  EXPECT_EQ(handler().get_errors_by_component("worker-0").size(), static_cast<size_t>(kReports));
}

// ============================================================================
// ERROR INFO AND EXCEPTIONS
// ============================================================================

TEST(ErrorInfoTest, LevelAndCategoryStrings) {
  ErrorInfo info(ErrorLevel::CRITICAL, ErrorCategory::DECODING, "codec", "decode", "broken");
  EXPECT_EQ(info.get_level_string(), "CRITICAL");
  EXPECT_EQ(info.get_category_string(), "DECODING");
  EXPECT_FALSE(info.error);
  EXPECT_EQ(info.get_summary(), "[CRITICAL] [codec] [decode] broken");
  EXPECT_FALSE(info.get_timestamp_string().empty());
}

TEST(ExceptionTest, FullMessageCarriesContext) {
  StreamcodecException plain("failed", "delimiter_codec", "encode");
  EXPECT_STREQ(plain.what(), "failed");
  EXPECT_EQ(plain.get_full_message(), "[delimiter_codec] failed (operation: encode)");

  StreamcodecException bare("failed");
  EXPECT_EQ(bare.get_full_message(), "failed");
}

TEST(ExceptionTest, EncodeExceptionCarriesCode) {
  EncodeException e(ErrorCode::UnmappableCharacter, "cannot encode", "delimiter_codec");
  EXPECT_EQ(e.code(), ErrorCode::UnmappableCharacter);
  EXPECT_EQ(e.error_code().category(), codec_category());
  EXPECT_EQ(e.get_operation(), "encode");

  const StreamcodecException& base = e;
  EXPECT_EQ(base.get_component(), "delimiter_codec");
}

TEST(ExceptionTest, ConfigurationExceptionCarriesKey) {
  ConfigurationException e("bad value", "charset", "read");
  EXPECT_EQ(e.get_config_key(), "charset");
  EXPECT_EQ(e.get_component(), "configuration");
  EXPECT_EQ(e.get_full_message(), "[configuration] bad value (operation: read) (key: charset)");
  EXPECT_THROW(throw e, StreamcodecException);
}
