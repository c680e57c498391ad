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

#include "agent_config.hpp"
#include "relaykit/relay/peer_connection.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace rly::agent {

/**
 * Connection management shared by the agents: connects to the relay, introduces itself with a hello and serves the
 * connection until it fails, then reconnects after a delay. Runs until stopped.
 *
 * Derived classes must call stop() from their destructor.
 */
class Agent {
  public:
    Agent(Role role, AgentConfig config);
    virtual ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    /**
     * Runs the connect-serve-reconnect cycle on the calling thread until stop() is called.
     */
    void run();

    /**
     * Runs the agent on a thread of its own.
     */
    void start();

    /**
     * Ends run() and closes the connection. Safe to call from any thread and multiple times.
     */
    void stop();

    /**
     * @return True while connected to the relay.
     */
    [[nodiscard]] bool is_connected() const;

    /**
     * @return The number of connections established since construction.
     */
    [[nodiscard]] size_t num_connections() const;

    [[nodiscard]] Role role() const;
    [[nodiscard]] const AgentConfig& config() const;

  protected:
    /**
     * Serves an established connection.
     * @param connection The connection, hello already sent.
     * @return The error which ended the connection, or nothing when the agent was stopped.
     */
    virtual tl::expected<void, Error> serve(PeerConnection& connection) = 0;

    /**
     * Called after a connection ended.
     */
    virtual void on_disconnected() {}

    /**
     * Sleeps for given duration, or until the agent is stopped.
     * @param duration The time to sleep.
     * @return False if the agent was stopped.
     */
    bool sleep_for(std::chrono::milliseconds duration);

    [[nodiscard]] bool stop_requested() const;

  private:
    Role role_;
    AgentConfig config_;
    boost::asio::io_context io_context_;
    std::thread thread_;
    std::atomic<size_t> num_connections_ {0};

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_requested_ {false};
    std::shared_ptr<PeerConnection> connection_;

    void set_connection(std::shared_ptr<PeerConnection> connection);
};

}  // namespace rly::agent
