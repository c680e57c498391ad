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

#include "relay_error.hpp"
#include "relaykit/core/expected.hpp"
#include "relaykit/core/log.hpp"
#include "relaykit/wire/message_framer.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace rly {

/**
 * One live bidirectional channel to an agent. Sending is thread safe, receiving is done by a single reader thread.
 */
class PeerConnection {
  public:
    PeerConnection() = default;
    virtual ~PeerConnection() = default;

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    PeerConnection(PeerConnection&&) = delete;
    PeerConnection& operator=(PeerConnection&&) = delete;

    /**
     * Sends an encoded message. Safe to call from any thread.
     * @param encoded The encoded message, including the delimiter.
     * @return Nothing on success, or Error::connection_lost.
     */
    [[nodiscard]] virtual tl::expected<void, Error> send(const std::string& encoded) = 0;

    /**
     * Blocks until the next complete message arrives.
     * @return The message without delimiter, or Error::connection_lost / Error::malformed_message.
     */
    [[nodiscard]] virtual tl::expected<std::string, Error> receive() = 0;

    /**
     * Shuts the channel down in both directions, which wakes up a blocked receive. Safe to call multiple times and from
     * any thread.
     */
    virtual void close() = 0;

    /**
     * @return True until the channel failed or was closed.
     */
    [[nodiscard]] virtual bool is_alive() const = 0;

    /**
     * @return The address of the peer as address:port.
     */
    [[nodiscard]] virtual std::string remote_address() const = 0;

    /**
     * Encodes and sends a message.
     * @param message The message to send.
     * @return Nothing on success, or Error::connection_lost.
     */
    template<class T>
    [[nodiscard]] tl::expected<void, Error> send_message(const T& message) {
        return send(wire::encode(message));
    }

    /**
     * Receives and decodes the next message.
     * @return The decoded message, or the error which ended the channel.
     */
    template<class T>
    [[nodiscard]] tl::expected<T, Error> receive_message() {
        auto message = receive();
        if (!message) {
            return tl::unexpected(message.error());
        }
        auto decoded = wire::decode<T>(*message);
        if (!decoded) {
            RLY_WARNING("Malformed message from {}: {} ({})", remote_address(), decoded.error(), *message);
            return tl::unexpected(Error::malformed_message);
        }
        return std::move(*decoded);
    }
};

/**
 * PeerConnection over a TCP stream using blocking socket operations, intended to be driven by a dedicated thread.
 */
class TcpPeerConnection final: public PeerConnection {
  public:
    /**
     * Creates a connection from an accepted or connected socket.
     * @param socket The connected socket.
     */
    static std::shared_ptr<TcpPeerConnection> create(boost::asio::ip::tcp::socket socket) {
        return std::shared_ptr<TcpPeerConnection>(new TcpPeerConnection(std::move(socket)));
    }

    /**
     * Resolves given host and connects to it.
     * @param io_context The io_context the socket will be associated with. It doesn't need to be running.
     * @param host Host name or address.
     * @param port The port to connect to.
     * @return The connection, or Error::connection_lost if the host could not be reached.
     */
    static tl::expected<std::shared_ptr<TcpPeerConnection>, Error>
    connect(boost::asio::io_context& io_context, const std::string& host, uint16_t port);

    ~TcpPeerConnection() override;

    [[nodiscard]] tl::expected<void, Error> send(const std::string& encoded) override;
    [[nodiscard]] tl::expected<std::string, Error> receive() override;
    void close() override;
    [[nodiscard]] bool is_alive() const override;
    [[nodiscard]] std::string remote_address() const override;

  private:
    static constexpr size_t k_receive_chunk_size = 4096;

    boost::asio::ip::tcp::socket socket_;
    std::string remote_address_;
    wire::MessageFramer framer_;
    std::mutex send_mutex_;
    std::atomic<bool> alive_ {true};

    explicit TcpPeerConnection(boost::asio::ip::tcp::socket socket);
};

}  // namespace rly
