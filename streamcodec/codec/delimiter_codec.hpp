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

#include <memory>
#include <string>
#include <vector>

#include "streamcodec/base/visibility.hpp"
#include "streamcodec/charset/charset.hpp"
#include "streamcodec/codec/encode_state.hpp"
#include "streamcodec/codec/icodec.hpp"
#include "streamcodec/config/codec_config.hpp"
#include "streamcodec/config/iconfig_manager.hpp"
#include "streamcodec/memory/safe_span.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief Codec for delimiter-separated text records.
 *
 * Decoding splits each input chunk on the delimiter and emits every
 * fragment, empty ones included. Chunks are decoded independently: a
 * record cut by a chunk boundary comes out as two short fragments.
 *
 * Encoding writes record->to_text() followed by the delimiter, spreading
 * it over as many output buffers as needed. Between calls only whole
 * unwritten characters are kept, never partial byte sequences.
 */
class STREAMCODEC_API DelimiterCodec : public ICodec {
 public:
  /**
   * @throws diagnostics::ConfigurationException if config is invalid
   */
  explicit DelimiterCodec(config::CodecConfig config = config::CodecConfig());

  /**
   * @brief Construct from the "delimiter" and "charset" options of a config manager
   * @throws diagnostics::ConfigurationException on mistyped or invalid values
   */
  explicit DelimiterCodec(const config::ConfigManagerInterface& config);

  ~DelimiterCodec() override = default;

  DelimiterCodec(const DelimiterCodec&) = delete;
  DelimiterCodec& operator=(const DelimiterCodec&) = delete;

  void decode(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) override;
  void decode(memory::ConstByteSpan input, const DecodedUnitConsumer& emit);

  /**
   * Same as decode(): no partial input is retained between calls.
   */
  void flush(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) override;

  EncodeResult encode(const std::shared_ptr<const Record>& record, memory::ByteBuffer& output) override;

  /**
   * @brief encode() that reports failures as exceptions
   * @return true once the record has been fully written
   * @throws diagnostics::EncodeException for any failed result
   */
  bool encode_or_throw(const std::shared_ptr<const Record>& record, memory::ByteBuffer& output);

  std::unique_ptr<ICodec> clone() const override;
  const std::string& id() const noexcept override { return id_; }
  std::vector<config::ConfigItem> config_schema() const override;

  const config::CodecConfig& config() const noexcept { return config_; }

  bool is_pending() const noexcept { return !is_idle(state_); }

  /**
   * @brief Characters of the in-flight record not yet written, 0 when idle
   */
  size_t pending_characters() const noexcept;

 private:
  const config::CodecConfig config_;
  const std::u32string delimiter_chars_;
  const std::string id_;
  const charset::CharsetEncoder encoder_;
  EncodeState state_;

  EncodeResult reject(ErrorCode code, const std::string& message);
};

}  // namespace codec
}  // namespace streamcodec
