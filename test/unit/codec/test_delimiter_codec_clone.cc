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
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "streamcodec/codec/delimiter_codec.hpp"
#include "streamcodec/codec/record.hpp"
#include "utils/test_utils.hpp"

using namespace streamcodec;
using namespace streamcodec::codec;
using streamcodec::test::TestUtils;

class DelimiterCodecCloneTest : public ::testing::Test {
 protected:
    void SetUp() override { original_ = std::make_unique<DelimiterCodec>(config::CodecConfig(";")); }

    std::unique_ptr<DelimiterCodec> original_;
};

TEST_F(DelimiterCodecCloneTest, IdIsStableAndNonEmpty) {
    const std::string id = original_->id();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(id.size(), 36u);

    memory::ByteBuffer buffer(16);
    original_->encode(std::make_shared<TextRecord>("x"), buffer);
    EXPECT_EQ(original_->id(), id);
}

TEST_F(DelimiterCodecCloneTest, CloneHasFreshIdentity) {
    auto copy = original_->clone();
    ASSERT_NE(copy.get(), nullptr);
    EXPECT_NE(copy->id(), original_->id());

    std::set<std::string> ids{original_->id()};
    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(ids.insert(original_->clone()->id()).second);
    }
}

TEST_F(DelimiterCodecCloneTest, CloneSharesConfiguration) {
    auto copy = original_->clone();
    auto* typed = dynamic_cast<DelimiterCodec*>(copy.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_EQ(typed->config(), original_->config());
}

TEST_F(DelimiterCodecCloneTest, CloneProducesIdenticalOutput) {
    auto copy = original_->clone();
    auto record = std::make_shared<TextRecord>("same bytes");

    memory::ByteBuffer a(64);
    memory::ByteBuffer b(64);
    ASSERT_TRUE(original_->encode(record, a).fully_written());
    ASSERT_TRUE(copy->encode(record, b).fully_written());
    EXPECT_EQ(a.remaining_string(), b.remaining_string());
    EXPECT_EQ(a.remaining_string(), "same bytes;");
}

TEST_F(DelimiterCodecCloneTest, CloneStartsIdleAndPendingIsIndependent) {
    auto first = std::make_shared<TextRecord>("pending on the original");
    memory::ByteBuffer small(4);
    ASSERT_FALSE(original_->encode(first, small).fully_written());
    ASSERT_TRUE(original_->is_pending());

    auto copy = original_->clone();
    auto* typed = dynamic_cast<DelimiterCodec*>(copy.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_FALSE(typed->is_pending());

    // The clone accepts a different record while the original is still pending
    auto second = std::make_shared<TextRecord>("other");
    memory::ByteBuffer buffer(64);
    EXPECT_TRUE(copy->encode(second, buffer).fully_written());
    EXPECT_TRUE(original_->is_pending());

    buffer.clear();
    EXPECT_TRUE(original_->encode(second, buffer).is_out_of_order());
}

TEST_F(DelimiterCodecCloneTest, ClonesEncodeConcurrently) {
    constexpr int kWorkers = 4;
    constexpr int kRecordsPerWorker = 200;

    std::vector<std::unique_ptr<ICodec>> codecs;
    for (int i = 0; i < kWorkers; ++i) {
        codecs.push_back(original_->clone());
    }

    std::vector<std::string> outputs(kWorkers);
    std::vector<std::thread> workers;
    for (int w = 0; w < kWorkers; ++w) {
        workers.emplace_back([&, w]() {
            for (int r = 0; r < kRecordsPerWorker; ++r) {
                auto record = std::make_shared<TextRecord>("worker-" + std::to_string(w) + "-record-" +
                                                           std::to_string(r));
                outputs[w] += TestUtils::encode_in_chunks(*codecs[w], record, 5);
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    for (int w = 0; w < kWorkers; ++w) {
        std::vector<std::string> messages;
        original_->decode(memory::as_bytes(outputs[w]), TestUtils::collect_messages(messages));
        // Trailing delimiter leaves one empty fragment
        ASSERT_EQ(messages.size(), static_cast<size_t>(kRecordsPerWorker + 1));
        for (int r = 0; r < kRecordsPerWorker; ++r) {
            EXPECT_EQ(messages[r], "worker-" + std::to_string(w) + "-record-" + std::to_string(r));
        }
        EXPECT_EQ(messages.back(), "");
    }
}
