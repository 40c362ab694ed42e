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

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "streamcodec/codec/delimiter_codec.hpp"
#include "streamcodec/codec/record.hpp"
#include "streamcodec/diagnostics/error_handler.hpp"
#include "streamcodec/diagnostics/exceptions.hpp"
#include "streamcodec/diagnostics/logger.hpp"
#include "utils/test_utils.hpp"

using namespace streamcodec;
using namespace streamcodec::codec;
using streamcodec::test::TestUtils;

class DelimiterCodecEncodeTest : public ::testing::Test {
 protected:
    void SetUp() override {
        diagnostics::ErrorHandler::instance().reset_stats();
        codec_ = std::make_unique<DelimiterCodec>();
    }

    void TearDown() override { diagnostics::ErrorHandler::instance().reset_stats(); }

    static std::shared_ptr<const Record> text(const std::string& s) { return std::make_shared<TextRecord>(s); }

    std::unique_ptr<DelimiterCodec> codec_;
};

TEST_F(DelimiterCodecEncodeTest, RoundTripThroughLargeBuffer) {
    auto record = text("hello world");
    memory::ByteBuffer buffer(100);

    EncodeResult result = codec_->encode(record, buffer);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.fully_written());
    EXPECT_FALSE(codec_->is_pending());
    EXPECT_EQ(buffer.position(), 0u);
    EXPECT_EQ(buffer.remaining_string(), "hello world,");

    std::vector<std::string> messages;
    codec_->decode(buffer, TestUtils::collect_messages(messages));
    ASSERT_GE(messages.size(), 1u);
    EXPECT_EQ(messages[0], "hello world");
    EXPECT_FALSE(buffer.has_remaining());
}

TEST_F(DelimiterCodecEncodeTest, SplitAcrossSmallBuffers) {
    const std::string body = "this record is much longer than a single tiny output buffer";
    auto record = text(body);

    std::vector<bool> results;
    std::string bytes = TestUtils::encode_in_chunks(*codec_, record, 7, &results);

    EXPECT_EQ(bytes, body + ",");
    ASSERT_EQ(results.size(), (body.size() + 1 + 6) / 7);
    for (size_t i = 0; i + 1 < results.size(); ++i) {
        EXPECT_FALSE(results[i]) << "call " << i;
    }
    EXPECT_TRUE(results.back());
    EXPECT_FALSE(codec_->is_pending());
}

TEST_F(DelimiterCodecEncodeTest, PendingShrinksOnEveryCall) {
    auto record = text("abcdefghij");
    memory::ByteBuffer buffer(4);

    EXPECT_FALSE(codec_->encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "abcd");
    EXPECT_EQ(codec_->pending_characters(), 7u);

    buffer.clear();
    EXPECT_FALSE(codec_->encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "efgh");
    EXPECT_EQ(codec_->pending_characters(), 3u);

    buffer.clear();
    EXPECT_TRUE(codec_->encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "ij,");
    EXPECT_EQ(codec_->pending_characters(), 0u);
}

TEST_F(DelimiterCodecEncodeTest, ExactFitCompletes) {
    auto record = text("abc");
    memory::ByteBuffer buffer(4);

    EncodeResult result = codec_->encode(record, buffer);
    EXPECT_TRUE(result.fully_written());
    EXPECT_EQ(buffer.remaining_string(), "abc,");
    EXPECT_FALSE(codec_->is_pending());
}

TEST_F(DelimiterCodecEncodeTest, OutOfOrderRecordIsRejected) {
    auto first = text("a record that does not fit");
    auto second = text("another record");
    memory::ByteBuffer buffer(5);

    ASSERT_FALSE(codec_->encode(first, buffer).fully_written());
    const size_t pending = codec_->pending_characters();

    memory::ByteBuffer other(5);
    EncodeResult result = codec_->encode(second, other);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.is_out_of_order());
    EXPECT_EQ(result.code(), ErrorCode::RecordOutOfOrder);
    EXPECT_EQ(result.error_code(), make_error_code(ErrorCode::RecordOutOfOrder));

    // Neither the state nor the buffer changed
    EXPECT_EQ(codec_->pending_characters(), pending);
    EXPECT_EQ(other.position(), 0u);
    EXPECT_EQ(other.limit(), 5u);

    EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("delimiter_codec"));
    EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count("delimiter_codec",
                                                                    diagnostics::ErrorLevel::WARNING),
              1u);
}

TEST_F(DelimiterCodecEncodeTest, OutOfOrderLeavesPartiallyWrittenBufferAlone) {
    auto first = text("abcdefgh");
    auto second = text("xyz");
    memory::ByteBuffer buffer(4);

    ASSERT_FALSE(codec_->encode(first, buffer).fully_written());
    const size_t position = buffer.position();
    const size_t limit = buffer.limit();
    ASSERT_EQ(buffer.remaining_string(), "abcd");

    // Same buffer, not drained or cleared
    EncodeResult result = codec_->encode(second, buffer);
    EXPECT_TRUE(result.is_out_of_order());
    EXPECT_EQ(buffer.position(), position);
    EXPECT_EQ(buffer.limit(), limit);
    EXPECT_EQ(buffer.remaining_string(), "abcd");
    EXPECT_EQ(codec_->pending_characters(), 5u);
}

TEST_F(DelimiterCodecEncodeTest, EqualContentIsNotTheSameRecord) {
    auto first = text("duplicate content here");
    auto copy = text("duplicate content here");
    memory::ByteBuffer buffer(4);

    ASSERT_FALSE(codec_->encode(first, buffer).fully_written());
    buffer.clear();
    EXPECT_TRUE(codec_->encode(copy, buffer).is_out_of_order());
}

TEST_F(DelimiterCodecEncodeTest, OriginalRecordResumesAfterRejection) {
    auto first = text("0123456789");
    auto intruder = text("x");
    memory::ByteBuffer buffer(6);

    ASSERT_FALSE(codec_->encode(first, buffer).fully_written());
    std::string bytes = buffer.remaining_string();

    buffer.clear();
    ASSERT_TRUE(codec_->encode(intruder, buffer).is_out_of_order());

    buffer.clear();
    ASSERT_TRUE(codec_->encode(first, buffer).fully_written());
    bytes += buffer.remaining_string();
    EXPECT_EQ(bytes, "0123456789,");
}

TEST_F(DelimiterCodecEncodeTest, ZeroCapacityMakesNoProgress) {
    auto record = text("abc");
    memory::ByteBuffer empty(0);

    EncodeResult result = codec_->encode(record, empty);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.fully_written());
    EXPECT_TRUE(codec_->is_pending());
    EXPECT_EQ(codec_->pending_characters(), 4u);
    EXPECT_FALSE(empty.has_remaining());

    result = codec_->encode(record, empty);
    EXPECT_FALSE(result.fully_written());
    EXPECT_EQ(codec_->pending_characters(), 4u);

    memory::ByteBuffer buffer(16);
    EXPECT_TRUE(codec_->encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "abc,");
}

TEST_F(DelimiterCodecEncodeTest, MultiByteCharactersAreNeverSplit) {
    // "\xC3\xA9" is U+00E9, "\xE2\x82\xAC" is U+20AC
    const std::string body = "\xC3\xA9\xE2\x82\xAC\xC3\xA9";
    auto record = text(body);
    memory::ByteBuffer buffer(2);

    std::vector<std::string> chunks;
    for (int i = 0; i < 10; ++i) {
        buffer.clear();
        EncodeResult result = codec_->encode(record, buffer);
        ASSERT_TRUE(result.ok());
        chunks.push_back(buffer.remaining_string());
        if (result.fully_written()) {
            break;
        }
    }

    // The euro sign needs three bytes and can never fit in a two-byte buffer
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "\xC3\xA9");
    EXPECT_EQ(chunks[1], "");
    EXPECT_TRUE(codec_->is_pending());
}

TEST_F(DelimiterCodecEncodeTest, MultiByteCharactersAcrossBuffers) {
    const std::string body = "caf\xC3\xA9 \xE2\x82\xAC 5";
    auto record = text(body);

    std::string bytes = TestUtils::encode_in_chunks(*codec_, record, 3);
    EXPECT_EQ(bytes, body + ",");
}

TEST_F(DelimiterCodecEncodeTest, WritesAfterExistingContent) {
    auto record = text("xy");
    memory::ByteBuffer buffer(10);
    buffer.put(static_cast<uint8_t>('>'));

    ASSERT_TRUE(codec_->encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.position(), 1u);
    EXPECT_EQ(buffer.limit(), 4u);
    EXPECT_EQ(buffer.remaining_string(), "xy,");
}

TEST_F(DelimiterCodecEncodeTest, UnmappableCharacterResetsState) {
    DelimiterCodec ascii(config::CodecConfig(",", charset::Charset::UsAscii));
    auto record = text("ab\xC3\xA9" "cd");
    memory::ByteBuffer buffer(16);

    EncodeResult result = ascii.encode(record, buffer);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.is_transform_failure());
    EXPECT_EQ(result.code(), ErrorCode::UnmappableCharacter);
    EXPECT_NE(result.message().find("U+00E9"), std::string::npos);
    EXPECT_FALSE(ascii.is_pending());

    // Bytes written before the failure stay readable
    EXPECT_EQ(buffer.remaining_string(), "ab");

    EXPECT_EQ(diagnostics::ErrorHandler::instance().get_error_count("delimiter_codec",
                                                                    diagnostics::ErrorLevel::ERROR),
              1u);

    // A new record is accepted afterwards
    buffer.clear();
    EXPECT_TRUE(ascii.encode(text("ok"), buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "ok,");
}

TEST_F(DelimiterCodecEncodeTest, Latin1EncodesSingleBytes) {
    DelimiterCodec latin1(config::CodecConfig(";", charset::Charset::Iso8859_1));
    auto record = text("caf\xC3\xA9");
    memory::ByteBuffer buffer(16);

    ASSERT_TRUE(latin1.encode(record, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "caf\xE9;");
}

TEST_F(DelimiterCodecEncodeTest, MalformedRecordTextIsRejected) {
    auto record = text("bad \xFF text");
    memory::ByteBuffer buffer(32);

    EncodeResult result = codec_->encode(record, buffer);
    EXPECT_TRUE(result.is_transform_failure());
    EXPECT_FALSE(codec_->is_pending());
    EXPECT_FALSE(buffer.has_remaining());
}

TEST_F(DelimiterCodecEncodeTest, NullRecordIsRejected) {
    memory::ByteBuffer buffer(8);

    EncodeResult result = codec_->encode(nullptr, buffer);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(buffer.position(), 0u);
    EXPECT_EQ(buffer.limit(), 8u);
    EXPECT_FALSE(codec_->is_pending());
}

TEST_F(DelimiterCodecEncodeTest, EncodeOrThrowReportsProgress) {
    auto record = text("abcdef");
    memory::ByteBuffer buffer(4);

    EXPECT_FALSE(codec_->encode_or_throw(record, buffer));
    buffer.clear();
    EXPECT_TRUE(codec_->encode_or_throw(record, buffer));
}

TEST_F(DelimiterCodecEncodeTest, EncodeOrThrowThrowsOnOutOfOrder) {
    memory::ByteBuffer buffer(2);
    ASSERT_FALSE(codec_->encode_or_throw(text("abcdef"), buffer));

    buffer.clear();
    try {
        codec_->encode_or_throw(text("other"), buffer);
        FAIL() << "Expected EncodeException";
    } catch (const diagnostics::EncodeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::RecordOutOfOrder);
        EXPECT_EQ(e.get_component(), "delimiter_codec");
    }
}

TEST_F(DelimiterCodecEncodeTest, EventRecordUsesTextualForm) {
    auto event = std::make_shared<Event>("started");
    event->set_field(Event::kHostField, "node-1");
    memory::ByteBuffer buffer(64);

    ASSERT_TRUE(codec_->encode(event, buffer).fully_written());
    EXPECT_EQ(buffer.remaining_string(), "node-1 started,");
}

TEST_F(DelimiterCodecEncodeTest, MultiCharacterDelimiter) {
    DelimiterCodec codec(config::CodecConfig("\r\n"));

    std::string bytes = TestUtils::encode_in_chunks(codec, text("line"), 3);
    EXPECT_EQ(bytes, "line\r\n");
}

class DelimiterCodecLoggingTest : public ::testing::Test {
 protected:
    void SetUp() override {
        auto& logger = diagnostics::Logger::instance();
        logger.set_level(diagnostics::LogLevel::DEBUG);
        logger.set_outputs(0);
        logger.set_format("{level} {operation} {message}");
        logger.set_callback([this](diagnostics::LogLevel, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line);
        });
    }

    void TearDown() override {
        auto& logger = diagnostics::Logger::instance();
        logger.set_callback(nullptr);
        logger.set_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
        logger.set_level(diagnostics::LogLevel::INFO);
        logger.set_outputs(static_cast<int>(diagnostics::LogOutput::CONSOLE));
        diagnostics::ErrorHandler::instance().reset_stats();
    }

    bool logged(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : lines_) {
            if (line.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::mutex mutex_;
    std::vector<std::string> lines_;
};

TEST_F(DelimiterCodecLoggingTest, StateTransitionsAreLoggedAtDebug) {
    DelimiterCodec codec;
    auto record = std::make_shared<TextRecord>("abcdef");
    memory::ByteBuffer buffer(4);

    ASSERT_FALSE(codec.encode(record, buffer).fully_written());
    EXPECT_TRUE(logged("DEBUG encode Output full after 4 bytes"));

    buffer.clear();
    ASSERT_TRUE(codec.encode(record, buffer).fully_written());
    EXPECT_TRUE(logged("DEBUG encode Resuming record, 3 characters left"));
    EXPECT_TRUE(logged("DEBUG encode Record complete after 3 bytes"));
}
