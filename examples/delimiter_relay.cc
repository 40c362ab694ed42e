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

#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "streamcodec/streamcodec.hpp"

using namespace streamcodec;

/**
 * Delimiter relay
 *
 * Reads a delimited stream from stdin, decodes it into units, wraps each
 * unit in an Event and re-encodes it through a deliberately small output
 * buffer, writing the bytes to stdout.
 *
 * Usage: delimiter_relay [codec.yaml] [buffer-size]
 */
int main(int argc, char** argv) {
    diagnostics::Logger::instance().set_level(diagnostics::LogLevel::WARNING);

    config::CodecConfig settings;
    if (argc > 1) {
        try {
            settings = config::load_codec_config_from_yaml(argv[1]);
        } catch (const diagnostics::ConfigurationException& e) {
            std::cerr << e.get_full_message() << std::endl;
            return 1;
        }
    }

    size_t buffer_size = 8;
    if (argc > 2) {
        try {
            buffer_size = static_cast<size_t>(std::stoul(argv[2]));
        } catch (const std::logic_error&) {
            std::cerr << "Invalid buffer size: " << argv[2] << std::endl;
            return 1;
        }
    }

    codec::DelimiterCodec decoder(settings);
    auto encoder = decoder.clone();

    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    memory::ByteBuffer in = memory::ByteBuffer::wrap(input);

    std::vector<std::string> messages;
    decoder.flush(in, [&messages](codec::DecodedUnit unit) { messages.push_back(unit[codec::kMessageField]); });

    memory::ByteBuffer out(buffer_size);
    size_t calls = 0;
    for (const auto& message : messages) {
        auto event = std::make_shared<codec::Event>(message);
        event->set_field(codec::Event::kHostField, "relay");

        bool done = false;
        while (!done) {
            out.clear();
            codec::EncodeResult result = encoder->encode(event, out);
            if (!result.ok()) {
                std::cerr << "Encode failed: " << result.message() << std::endl;
                return 1;
            }
            std::cout << out.remaining_string();
            done = result.fully_written();
            ++calls;
            if (!done && buffer_size == 0) {
                std::cerr << "Output buffer has no capacity" << std::endl;
                return 1;
            }
        }
    }
    std::cout.flush();

    std::cerr << messages.size() << " units relayed in " << calls << " encode calls (codec " << encoder->id()
              << ")" << std::endl;
    return 0;
}
