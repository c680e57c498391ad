/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "fake_peer_connection.hpp"
#include "relaykit/net/io_context_runner.hpp"
#include "relaykit/net/tcp_listener.hpp"
#include "relaykit/relay/peer_connection.hpp"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <mutex>

TEST_CASE("rly::TcpListener") {
    SECTION("Accepted sockets are handed to the handler") {
        rly::IoContextRunner runner;
        std::mutex mutex;
        std::vector<std::shared_ptr<rly::TcpPeerConnection>> accepted;

        rly::TcpListener listener(
            runner.io_context(), {boost::asio::ip::make_address("127.0.0.1"), 0},
            [&](boost::asio::ip::tcp::socket socket) {
                std::lock_guard lock(mutex);
                accepted.push_back(rly::TcpPeerConnection::create(std::move(socket)));
            }
        );
        REQUIRE(listener.port() != 0);
        runner.start();
        REQUIRE(runner.is_running());

        boost::asio::io_context io_context;
        auto client = rly::TcpPeerConnection::connect(io_context, "127.0.0.1", listener.port());
        REQUIRE(client);

        REQUIRE(rly::test::wait_until([&] {
            std::lock_guard lock(mutex);
            return accepted.size() == 1;
        }));

        REQUIRE((*client)->send("{\"type\":\"hello\",\"id\":\"a\"}\n{\"type\":\"hello\",\"id\":\"b\"}\n"));
        std::shared_ptr<rly::TcpPeerConnection> server;
        {
            std::lock_guard lock(mutex);
            server = accepted.front();
        }
        const auto first = server->receive_message<rly::wire::Hello>();
        REQUIRE(first);
        REQUIRE(first->agent_id == "a");
        const auto second = server->receive_message<rly::wire::Hello>();
        REQUIRE(second);
        REQUIRE(second->agent_id == "b");

        (*client)->close();
        REQUIRE_FALSE(server->receive());
        REQUIRE_FALSE(server->is_alive());

        listener.stop();
        REQUIRE(listener.port() == 0);
        runner.stop();
        REQUIRE_FALSE(runner.is_running());
    }

    SECTION("Port in use") {
        boost::asio::io_context io_context;
        rly::TcpListener listener(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0}, [](auto) {});
        const boost::asio::ip::tcp::endpoint taken(boost::asio::ip::make_address("127.0.0.1"), listener.port());
        const auto on_accept = [](boost::asio::ip::tcp::socket) {};
        REQUIRE_THROWS_AS(rly::TcpListener(io_context, taken, on_accept), boost::system::system_error);
    }

    SECTION("Connecting to a closed port fails") {
        boost::asio::io_context io_context;
        uint16_t port = 0;
        {
            rly::TcpListener listener(io_context, {boost::asio::ip::make_address("127.0.0.1"), 0}, [](auto) {});
            port = listener.port();
        }
        REQUIRE_FALSE(rly::TcpPeerConnection::connect(io_context, "127.0.0.1", port));
    }
}

TEST_CASE("rly::IoContextRunner") {
    rly::IoContextRunner runner;
    std::atomic<int> count {0};

    runner.start();
    for (int i = 0; i < 10; ++i) {
        boost::asio::post(runner.io_context(), [&count] {
            count++;
        });
    }
    REQUIRE(rly::test::wait_until([&] {
        return count == 10;
    }));

    runner.stop();
    runner.start();
    boost::asio::post(runner.io_context(), [&count] {
        count++;
    });
    REQUIRE(rly::test::wait_until([&] {
        return count == 11;
    }));
    runner.stop();
}
