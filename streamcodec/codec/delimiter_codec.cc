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

#include "streamcodec/codec/delimiter_codec.hpp"

#include <cstdio>

#include "streamcodec/codec/codec_id.hpp"
#include "streamcodec/config/codec_config_loader.hpp"
#include "streamcodec/diagnostics/error_handler.hpp"
#include "streamcodec/diagnostics/exceptions.hpp"
#include "streamcodec/diagnostics/logger.hpp"

namespace streamcodec {
namespace codec {

namespace {

constexpr const char* kComponent = "delimiter_codec";

config::CodecConfig validated(config::CodecConfig config) {
  std::string error = config.validation_error();
  if (!error.empty()) {
    diagnostics::error_reporting::report_configuration_error(kComponent, "construct", error);
    throw diagnostics::ConfigurationException(error, config::kDelimiterKey, "construct");
  }
  return config;
}

std::string describe(char32_t ch) {
  char buf[16] = {0};
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(ch));
  return buf;
}

// Leave output ready for reading: [start, end of written bytes)
void hand_over(memory::ByteBuffer& output, size_t start) {
  output.set_limit(output.position());
  output.set_position(start);
}

}  // namespace

DelimiterCodec::DelimiterCodec(config::CodecConfig config)
    : config_(validated(std::move(config))),
      delimiter_chars_(charset::decode_utf8(config_.delimiter)),
      id_(generate_codec_id()),
      encoder_(config_.charset),
      state_(Idle{}) {
  STREAMCODEC_LOG_DEBUG(kComponent, "construct",
                        "Codec " + id_ + " created (charset " + std::string(charset::charset_name(config_.charset)) +
                            ")");
}

DelimiterCodec::DelimiterCodec(const config::ConfigManagerInterface& config)
    : DelimiterCodec(config::codec_config_from(config)) {}

void DelimiterCodec::decode(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) {
  memory::ConstByteSpan bytes = input.remaining_span();
  input.set_position(input.limit());
  decode(bytes, emit);
}

void DelimiterCodec::decode(memory::ConstByteSpan input, const DecodedUnitConsumer& emit) {
  if (input.empty()) {
    return;
  }

  const std::string text = charset::decode_to_utf8(config_.charset, input);
  const std::string& delimiter = config_.delimiter;

  size_t units = 0;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(delimiter, start);
    if (pos == std::string::npos) {
      emit(make_decoded_unit(text.substr(start)));
      ++units;
      break;
    }
    emit(make_decoded_unit(text.substr(start, pos - start)));
    ++units;
    start = pos + delimiter.size();
  }

  STREAMCODEC_LOG_DEBUG(kComponent, "decode",
                        "Decoded " + std::to_string(units) + " units from " + std::to_string(input.size()) + " bytes");
}

void DelimiterCodec::flush(memory::ByteBuffer& input, const DecodedUnitConsumer& emit) { decode(input, emit); }

EncodeResult DelimiterCodec::encode(const std::shared_ptr<const Record>& record, memory::ByteBuffer& output) {
  if (!record) {
    return reject(ErrorCode::InvalidArgument, "Record must not be null");
  }

  const size_t start = output.position();

  if (const auto* pending = std::get_if<Pending>(&state_)) {
    if (pending->record != record) {
      return reject(ErrorCode::RecordOutOfOrder,
                    "New record supplied before encoding of previous record was completed");
    }
    STREAMCODEC_LOG_DEBUG(kComponent, "encode",
                          "Resuming record, " + std::to_string(pending->remaining.size()) + " characters left");
  } else {
    bool malformed = false;
    std::u32string chars = charset::decode_utf8(record->to_text(), &malformed);
    if (malformed) {
      hand_over(output, start);
      return reject(ErrorCode::UnmappableCharacter, "Record text is not valid UTF-8");
    }
    chars += delimiter_chars_;
    state_ = Pending{record, std::move(chars)};
  }

  auto& pending = std::get<Pending>(state_);
  const charset::TransformResult result = encoder_.encode(pending.remaining, output);
  hand_over(output, start);

  switch (result.status) {
    case charset::TransformStatus::Underflow:
      state_ = Idle{};
      STREAMCODEC_LOG_DEBUG(kComponent, "encode",
                            "Record complete after " + std::to_string(result.written) + " bytes");
      return EncodeResult::complete();

    case charset::TransformStatus::Overflow:
      pending.remaining.erase(0, result.consumed);
      STREAMCODEC_LOG_DEBUG(kComponent, "encode",
                            "Output full after " + std::to_string(result.written) + " bytes, " +
                                std::to_string(pending.remaining.size()) + " characters pending");
      return EncodeResult::partial();

    case charset::TransformStatus::Unmappable: {
      const char32_t ch = pending.remaining[result.consumed];
      state_ = Idle{};
      return reject(ErrorCode::UnmappableCharacter, "Character " + describe(ch) + " is not representable in " +
                                                        std::string(charset::charset_name(config_.charset)));
    }
  }

  state_ = Idle{};
  return reject(ErrorCode::Unknown, "Unexpected charset transform status");
}

bool DelimiterCodec::encode_or_throw(const std::shared_ptr<const Record>& record, memory::ByteBuffer& output) {
  EncodeResult result = encode(record, output);
  if (!result.ok()) {
    throw diagnostics::EncodeException(result.code(), result.message(), kComponent);
  }
  return result.fully_written();
}

std::unique_ptr<ICodec> DelimiterCodec::clone() const {
  auto copy = std::make_unique<DelimiterCodec>(config_);
  STREAMCODEC_LOG_DEBUG(kComponent, "clone", "Codec " + id_ + " cloned as " + copy->id());
  return copy;
}

std::vector<config::ConfigItem> DelimiterCodec::config_schema() const { return config::codec_config_schema(); }

size_t DelimiterCodec::pending_characters() const noexcept {
  if (const auto* pending = std::get_if<Pending>(&state_)) {
    return pending->remaining.size();
  }
  return 0;
}

EncodeResult DelimiterCodec::reject(ErrorCode code, const std::string& message) {
  if (code == ErrorCode::RecordOutOfOrder) {
    STREAMCODEC_LOG_WARNING(kComponent, "encode", message);
  } else {
    STREAMCODEC_LOG_ERROR(kComponent, "encode", message);
  }
  diagnostics::error_reporting::report_encode_error(kComponent, code, message, id_);
  return EncodeResult::failure(code, message);
}

}  // namespace codec
}  // namespace streamcodec
