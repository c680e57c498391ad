/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/wire/message_framer.hpp"

rly::wire::MessageFramer::MessageFramer(const size_t max_message_size) : max_message_size_(max_message_size) {}

void rly::wire::MessageFramer::feed(const std::string_view data) {
    // Compact before growing, consumed messages are at the front.
    if (read_position_ > 0) {
        buffer_.erase(0, read_position_);
        read_position_ = 0;
    }
    buffer_.append(data);
}

std::optional<std::string> rly::wire::MessageFramer::next() {
    while (read_position_ < buffer_.size()) {
        const auto pos = buffer_.find(k_message_delimiter, read_position_);
        if (pos == std::string::npos) {
            return std::nullopt;
        }

        auto length = pos - read_position_;
        if (length > 0 && buffer_[pos - 1] == '\r') {
            length--;
        }

        std::string message = buffer_.substr(read_position_, length);
        read_position_ = pos + 1;

        if (!message.empty()) {
            return message;
        }
    }
    return std::nullopt;
}

bool rly::wire::MessageFramer::overflowed() const {
    return buffered_size() > max_message_size_;
}

size_t rly::wire::MessageFramer::buffered_size() const {
    return buffer_.size() - read_position_;
}

void rly::wire::MessageFramer::reset() {
    buffer_.clear();
    read_position_ = 0;
}
