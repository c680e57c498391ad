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

#include <boost/asio.hpp>

#include <functional>

namespace rly {

/**
 * Accepts TCP connections on an endpoint and hands each accepted socket to a handler, until stopped.
 */
class TcpListener {
  public:
    using AcceptHandler = std::function<void(boost::asio::ip::tcp::socket socket)>;

    /**
     * Opens, binds and starts listening.
     * @param io_context The io_context to accept on. The handler is called from its thread.
     * @param endpoint The endpoint to listen on. Port 0 picks a free port.
     * @param on_accept Called for every accepted connection.
     * @throws boost::system::system_error if the endpoint can't be bound.
     */
    TcpListener(
        boost::asio::io_context& io_context, const boost::asio::ip::tcp::endpoint& endpoint, AcceptHandler on_accept
    );

    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    TcpListener(TcpListener&&) = delete;
    TcpListener& operator=(TcpListener&&) = delete;

    /**
     * @return The port the listener is bound to, or 0 when stopped.
     */
    [[nodiscard]] uint16_t port() const;

    /**
     * Stops accepting and closes the acceptor. Must not run concurrently with the io_context.
     */
    void stop();

  private:
    boost::asio::ip::tcp::acceptor acceptor_;
    AcceptHandler on_accept_;

    void async_accept();
};

}  // namespace rly
