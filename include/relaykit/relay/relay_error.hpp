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

namespace rly {

enum class Error {
    /// The peer closed or reset the channel.
    connection_lost,
    /// A payload failed to parse or exceeded the maximum message size.
    malformed_message,
    /// No acknowledgement arrived within the correlation timeout.
    correlation_timeout,
    /// A report sink failed to persist a finalised session.
    report_sink_failure,
    /// The first message on a connection was not a valid hello.
    handshake_failed,
    /// The hello named a different role than the port it connected to.
    role_mismatch,
};

inline const char* to_string(const Error error) {
    switch (error) {
        case Error::connection_lost:
            return "connection lost";
        case Error::malformed_message:
            return "malformed message";
        case Error::correlation_timeout:
            return "correlation timeout";
        case Error::report_sink_failure:
            return "report sink failure";
        case Error::handshake_failed:
            return "handshake failed";
        case Error::role_mismatch:
            return "role mismatch";
        default:
            return "unknown error";
    }
}

}  // namespace rly
