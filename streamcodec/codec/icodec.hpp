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
#include "streamcodec/codec/decoded_unit.hpp"
#include "streamcodec/codec/encode_result.hpp"
#include "streamcodec/codec/record.hpp"
#include "streamcodec/config/iconfig_manager.hpp"
#include "streamcodec/memory/byte_buffer.hpp"

namespace streamcodec {
namespace codec {

/**
 * @brief Abstract base class for stream codecs.
 *
 * Converts between bytes on a stream and discrete records through
 * bounded buffers. All calls are synchronous and run on the caller's
 * thread. An instance is not safe for concurrent use; give each worker
 * its own clone().
 */
class STREAMCODEC_API ICodec {
 public:
  virtual ~ICodec() = default;

  /**
   * @brief Decode the readable bytes of input into decoded units.
   *
   * input is consumed completely (position == limit on return). emit is
   * invoked once per unit, in input order, before decode returns.
   *
   * @param input Buffer ready for reading.
   * @param emit Consumer of decoded units.
   */
  virtual void decode(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) = 0;

  /**
   * @brief Final decode at end-of-stream.
   *
   * Called once, after the last decode(), to drain input and any state
   * the codec retained between decode calls.
   */
  virtual void flush(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) = 0;

  /**
   * @brief Write the serialized form of record into output.
   *
   * output is handed over writable and returned flipped (ready for reading).
   * A Partial result means output filled up: drain it, clear it and call
   * encode again with the same record. Supplying a different record while
   * one is partially written fails with RecordOutOfOrder.
   *
   * @param record Record to encode; identity matters across calls.
   * @param output Writable buffer.
   */
  virtual EncodeResult encode(const std::shared_ptr<const Record>& record, memory::ByteBuffer& output) = 0;

  /**
   * @brief Fresh instance with the same configuration, a new id and no
   *        encode in progress.
   */
  virtual std::unique_ptr<ICodec> clone() const = 0;

  /**
   * @brief Identity fixed at construction
   */
  virtual const std::string& id() const noexcept = 0;

  /**
   * @brief Options this codec recognizes
   */
  virtual std::vector<config::ConfigItem> config_schema() const = 0;
};

}  // namespace codec
}  // namespace streamcodec
