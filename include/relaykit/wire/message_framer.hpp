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

#include "wire_codec.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rly::wire {

/**
 * Splits a byte stream into delimited messages. A stream transport does not preserve write boundaries, so bytes are
 * accumulated until a delimiter shows up, which handles both partial and combined messages.
 */
class MessageFramer {
  public:
    explicit MessageFramer(size_t max_message_size = k_max_message_size);

    /**
     * Adds received bytes to the internal buffer.
     * @param data The received bytes.
     */
    void feed(std::string_view data);

    /**
     * Takes the next complete message out of the buffer. Empty lines are skipped, a trailing carriage return is
     * removed.
     * @return The next message without delimiter, or nullopt if no complete message is buffered.
     */
    [[nodiscard]] std::optional<std::string> next();

    /**
     * @return True if the buffered partial message grew beyond the maximum message size. Once overflowed the stream
     * can't be resynchronised and the connection should be dropped.
     */
    [[nodiscard]] bool overflowed() const;

    /**
     * @return The number of buffered bytes which are not yet part of a returned message.
     */
    [[nodiscard]] size_t buffered_size() const;

    /**
     * Discards all buffered data.
     */
    void reset();

  private:
    size_t max_message_size_;
    std::string buffer_;
    size_t read_position_ {};
};

}  // namespace rly::wire
