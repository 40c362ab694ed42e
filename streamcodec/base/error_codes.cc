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

#include "streamcodec/base/error_codes.hpp"

namespace streamcodec {

namespace {

class CodecErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "streamcodec"; }

  std::string message(int ev) const override { return to_string(static_cast<ErrorCode>(ev)); }
};

}  // namespace

const boost::system::error_category& codec_category() noexcept {
  static const CodecErrorCategory instance;
  return instance;
}

}  // namespace streamcodec
