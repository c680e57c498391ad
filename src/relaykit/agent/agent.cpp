/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/agent/agent.hpp"

#include "relaykit/core/log.hpp"

rly::agent::Agent::Agent(const Role role, AgentConfig config) : role_(role), config_(std::move(config)) {}

rly::agent::Agent::~Agent() {
    RLY_ASSERT(!thread_.joinable(), "Derived agents must call stop() in their destructor");
    stop();
}

void rly::agent::Agent::run() {
    const auto port = config_.port_for(role_);
    RLY_INFO("Starting {} agent '{}'", to_string(role_), config_.agent_id);

    while (!stop_requested()) {
        RLY_INFO("Connecting to relay at {}:{}", config_.relay_host, port);
        auto connection = TcpPeerConnection::connect(io_context_, config_.relay_host, port);
        if (connection) {
            set_connection(*connection);

            const wire::Hello hello {config_.agent_id, role_};
            auto result = (*connection)->send_message(hello);
            if (result) {
                RLY_INFO("Connected to relay at {}", (*connection)->remote_address());
                num_connections_++;
                result = serve(**connection);
            }

            (*connection)->close();
            set_connection(nullptr);
            on_disconnected();

            if (!result) {
                RLY_WARNING("Connection to relay ended: {}", to_string(result.error()));
            }
        }

        if (stop_requested()) {
            break;
        }

        RLY_INFO("Retrying in {} ms", config_.reconnect_delay.count());
        if (!sleep_for(config_.reconnect_delay)) {
            break;
        }
    }

    RLY_INFO("Stopped {} agent '{}'", to_string(role_), config_.agent_id);
}

void rly::agent::Agent::start() {
    RLY_ASSERT_RETURN(!thread_.joinable(), "Agent already started");
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this] {
        run();
    });
}

void rly::agent::Agent::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
        if (connection_) {
            connection_->close();
        }
    }
    condition_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool rly::agent::Agent::is_connected() const {
    std::lock_guard lock(mutex_);
    return connection_ != nullptr && connection_->is_alive();
}

size_t rly::agent::Agent::num_connections() const {
    return num_connections_;
}

rly::Role rly::agent::Agent::role() const {
    return role_;
}

const rly::agent::AgentConfig& rly::agent::Agent::config() const {
    return config_;
}

bool rly::agent::Agent::sleep_for(const std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    return !condition_.wait_for(lock, duration, [this] {
        return stop_requested_;
    });
}

bool rly::agent::Agent::stop_requested() const {
    std::lock_guard lock(mutex_);
    return stop_requested_;
}

void rly::agent::Agent::set_connection(std::shared_ptr<PeerConnection> connection) {
    std::lock_guard lock(mutex_);
    connection_ = std::move(connection);
    if (connection_ && stop_requested_) {
        connection_->close();
    }
}
