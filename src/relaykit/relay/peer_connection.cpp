/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/peer_connection.hpp"

#include <array>

rly::TcpPeerConnection::TcpPeerConnection(boost::asio::ip::tcp::socket socket) : socket_(std::move(socket)) {
    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_address_ = "unknown";
        return;
    }
    remote_address_ = fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

rly::TcpPeerConnection::~TcpPeerConnection() {
    boost::system::error_code ec;
    socket_.close(ec);
}

tl::expected<std::shared_ptr<rly::TcpPeerConnection>, rly::Error>
rly::TcpPeerConnection::connect(boost::asio::io_context& io_context, const std::string& host, const uint16_t port) {
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context);
    const auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        RLY_ERROR("Failed to resolve {}: {}", host, ec.message());
        return tl::unexpected(Error::connection_lost);
    }

    boost::asio::ip::tcp::socket socket(io_context);
    boost::asio::connect(socket, results, ec);
    if (ec) {
        RLY_ERROR("Failed to connect to {}:{}: {}", host, port, ec.message());
        return tl::unexpected(Error::connection_lost);
    }

    socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        RLY_WARNING("Failed to disable nagle on connection to {}:{}: {}", host, port, ec.message());
    }

    return create(std::move(socket));
}

tl::expected<void, rly::Error> rly::TcpPeerConnection::send(const std::string& encoded) {
    std::lock_guard lock(send_mutex_);
    if (!alive_) {
        return tl::unexpected(Error::connection_lost);
    }
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(encoded), ec);
    if (ec) {
        RLY_ERROR("Write error to {}: {}", remote_address_, ec.message());
        alive_ = false;
        return tl::unexpected(Error::connection_lost);
    }
    return {};
}

tl::expected<std::string, rly::Error> rly::TcpPeerConnection::receive() {
    std::array<char, k_receive_chunk_size> chunk {};
    while (true) {
        // Once closed, buffered messages are not handed out anymore.
        if (!alive_) {
            return tl::unexpected(Error::connection_lost);
        }

        if (auto message = framer_.next()) {
            return std::move(*message);
        }

        if (framer_.overflowed()) {
            RLY_ERROR("Message from {} exceeds {} bytes without delimiter", remote_address_, wire::k_max_message_size);
            alive_ = false;
            return tl::unexpected(Error::malformed_message);
        }

        boost::system::error_code ec;
        const auto length = socket_.read_some(boost::asio::buffer(chunk), ec);
        if (ec) {
            if (ec == boost::asio::error::eof) {
                RLY_TRACE("EOF from {}", remote_address_);
            } else if (alive_) {
                RLY_ERROR("Read error from {}: {}", remote_address_, ec.message());
            }
            alive_ = false;
            return tl::unexpected(Error::connection_lost);
        }

        framer_.feed(std::string_view(chunk.data(), length));
    }
}

void rly::TcpPeerConnection::close() {
    alive_ = false;
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        RLY_TRACE("Shutdown of {} failed: {}", remote_address_, ec.message());
    }
}

bool rly::TcpPeerConnection::is_alive() const {
    return alive_;
}

std::string rly::TcpPeerConnection::remote_address() const {
    return remote_address_;
}
