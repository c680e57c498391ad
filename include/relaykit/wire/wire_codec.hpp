/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "wire_messages.hpp"

#include <string>
#include <string_view>

namespace rly::wire {

/// Messages are separated by a single newline. Serialized json never contains a raw newline.
constexpr char k_message_delimiter = '\n';

/// Upper bound for a single message, including the delimiter.
constexpr size_t k_max_message_size = 64 * 1024;

/**
 * Encodes a message as a single json object followed by the message delimiter.
 * @param message The message to encode.
 * @return The encoded message, ready to be written to a stream.
 */
template<class T>
std::string encode(const T& message) {
    auto encoded = boost::json::serialize(boost::json::value_from(message));
    encoded.push_back(k_message_delimiter);
    return encoded;
}

/**
 * Decodes a single message. The delimiter must already have been stripped.
 * @param message The message text.
 * @return The decoded message, or a description of why the message is malformed.
 */
template<class T>
tl::expected<T, std::string> decode(const std::string_view message) {
    return parse_json<T>(message);
}

}  // namespace rly::wire
