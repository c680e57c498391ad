/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/net/tcp_listener.hpp"

#include "relaykit/core/assert.hpp"
#include "relaykit/core/log.hpp"

rly::TcpListener::TcpListener(
    boost::asio::io_context& io_context, const boost::asio::ip::tcp::endpoint& endpoint, AcceptHandler on_accept
) :
    acceptor_(io_context, endpoint), on_accept_(std::move(on_accept)) {
    RLY_ASSERT(on_accept_ != nullptr, "An accept handler is required");
    async_accept();
}

rly::TcpListener::~TcpListener() {
    stop();
}

uint16_t rly::TcpListener::port() const {
    boost::system::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) {
        return 0;
    }
    return endpoint.port();
}

void rly::TcpListener::stop() {
    if (!acceptor_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    if (ec) {
        RLY_ERROR("Failed to close acceptor: {}", ec.message());
    }
}

void rly::TcpListener::async_accept() {
    acceptor_.async_accept([this](const boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            RLY_ERROR("Accept error: {}", ec.message());
            if (!acceptor_.is_open()) {
                return;
            }
            async_accept();
            return;
        }

        boost::system::error_code endpoint_ec;
        const auto remote = socket.remote_endpoint(endpoint_ec);
        if (!endpoint_ec) {
            RLY_TRACE("Accepting connection from: {}:{}", remote.address().to_string(), remote.port());
        }

        on_accept_(std::move(socket));
        async_accept();
    });
}
