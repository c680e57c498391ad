/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/peer_registry.hpp"

#include <utility>
#include <vector>

std::string rly::PeerInfo::to_string() const {
    return fmt::format("id={}, address={}", agent_id.empty() ? "-" : agent_id, remote_address);
}

rly::PeerRegistry::~PeerRegistry() {
    close_all();
}

std::shared_ptr<rly::PeerConnection> rly::PeerRegistry::register_connection(
    const Role role, std::shared_ptr<PeerConnection> connection, PeerInfo info
) {
    RLY_ASSERT_RETURN_WITH(connection != nullptr, "Connection must not be null", nullptr);

    std::lock_guard notify_lock(subscribers_mutex_);

    std::shared_ptr<PeerConnection> replaced;
    PeerInfo connected;
    {
        std::lock_guard lock(mutex_);
        auto& entry = entries_[index_of(role)];
        replaced = std::move(entry.connection);
        if (replaced) {
            RLY_INFO("Replacing {} peer {} with {}", to_string(role), entry.info.remote_address, info.remote_address);
            replaced->close();
        }

        entry.connection = std::move(connection);
        entry.info = std::move(info);
        connected = entry.info;
    }

    subscribers_.notify(&Subscriber::on_peer_connected, role, connected);

    return replaced;
}

std::shared_ptr<rly::PeerConnection> rly::PeerRegistry::current(const Role role) const {
    std::lock_guard lock(mutex_);
    return entries_[index_of(role)].connection;
}

bool rly::PeerRegistry::clear(const Role role, const PeerConnection& connection) {
    std::lock_guard notify_lock(subscribers_mutex_);

    Entry lost;
    {
        std::lock_guard lock(mutex_);
        auto& entry = entries_[index_of(role)];
        if (entry.connection.get() != &connection) {
            return false;
        }
        lost = std::move(entry);
        entry = {};
    }

    subscribers_.notify(&Subscriber::on_peer_disconnected, role, lost.info);

    return true;
}

void rly::PeerRegistry::close_all() {
    std::lock_guard notify_lock(subscribers_mutex_);

    std::vector<std::pair<Role, PeerInfo>> lost;
    {
        std::lock_guard lock(mutex_);
        for (const auto role : k_all_roles) {
            auto& entry = entries_[index_of(role)];
            if (!entry.connection) {
                continue;
            }
            entry.connection->close();
            lost.emplace_back(role, std::move(entry.info));
            entry = {};
        }
    }

    for (const auto& [role, info] : lost) {
        subscribers_.notify(&Subscriber::on_peer_disconnected, role, info);
    }
}

bool rly::PeerRegistry::is_connected(const Role role) const {
    std::lock_guard lock(mutex_);
    return entries_[index_of(role)].connection != nullptr;
}

std::string rly::PeerRegistry::remote_address(const Role role) const {
    std::lock_guard lock(mutex_);
    const auto& entry = entries_[index_of(role)];
    return entry.connection ? entry.info.remote_address : std::string();
}

std::optional<rly::PeerInfo> rly::PeerRegistry::info(const Role role) const {
    std::lock_guard lock(mutex_);
    const auto& entry = entries_[index_of(role)];
    if (!entry.connection) {
        return std::nullopt;
    }
    return entry.info;
}

bool rly::PeerRegistry::subscribe(Subscriber* subscriber) {
    std::lock_guard notify_lock(subscribers_mutex_);
    if (!subscribers_.add(subscriber)) {
        return false;
    }

    std::vector<std::pair<Role, PeerInfo>> connected;
    {
        std::lock_guard lock(mutex_);
        for (const auto role : k_all_roles) {
            const auto& entry = entries_[index_of(role)];
            if (entry.connection) {
                connected.emplace_back(role, entry.info);
            }
        }
    }

    for (const auto& [role, info] : connected) {
        subscriber->on_peer_connected(role, info);
    }
    return true;
}

bool rly::PeerRegistry::unsubscribe(const Subscriber* subscriber) {
    std::lock_guard notify_lock(subscribers_mutex_);
    return subscribers_.remove(subscriber);
}

size_t rly::PeerRegistry::index_of(const Role role) {
    return static_cast<size_t>(role);
}
