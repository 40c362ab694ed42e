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

// Core codec API
#include "streamcodec/codec/decoded_unit.hpp"
#include "streamcodec/codec/delimiter_codec.hpp"
#include "streamcodec/codec/encode_result.hpp"
#include "streamcodec/codec/icodec.hpp"
#include "streamcodec/codec/record.hpp"

// Buffers and charsets
#include "streamcodec/charset/charset.hpp"
#include "streamcodec/memory/byte_buffer.hpp"
#include "streamcodec/memory/safe_span.hpp"

// Configuration
#include "streamcodec/config/codec_config.hpp"
#include "streamcodec/config/codec_config_loader.hpp"
#include "streamcodec/config/config_manager.hpp"

// Error handling and logging
#include "streamcodec/base/error_codes.hpp"
#include "streamcodec/diagnostics/error_handler.hpp"
#include "streamcodec/diagnostics/exceptions.hpp"
#include "streamcodec/diagnostics/logger.hpp"
