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

#include "peer_connection.hpp"
#include "relaykit/core/util/subscriber_list.hpp"
#include "relaykit/wire/role.hpp"

#include <array>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace rly {

/**
 * What is known about the agent occupying a role.
 */
struct PeerInfo {
    std::string agent_id;
    std::string remote_address;
    double connected_at {};  // Wall clock seconds

    [[nodiscard]] std::string to_string() const;
};

/**
 * Holds at most one live connection per role. Registering a connection for an occupied role closes the previous one.
 * All operations are thread safe.
 */
class PeerRegistry {
  public:
    /**
     * Callbacks run without the registry's state lock, so they may query the registry. They must not subscribe,
     * unsubscribe or change registrations.
     */
    class Subscriber {
      public:
        virtual ~Subscriber() = default;

        /**
         * Called when a connection got registered for a role, including replacements.
         * @param role The role.
         * @param info Information about the new peer.
         */
        virtual void on_peer_connected(const Role role, const PeerInfo& info) {
            std::ignore = role;
            std::ignore = info;
        }

        /**
         * Called when the connection of a role went away and the role is now vacant.
         * @param role The role.
         * @param info Information about the peer that was lost.
         */
        virtual void on_peer_disconnected(const Role role, const PeerInfo& info) {
            std::ignore = role;
            std::ignore = info;
        }
    };

    PeerRegistry() = default;
    ~PeerRegistry();

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    PeerRegistry(PeerRegistry&&) = delete;
    PeerRegistry& operator=(PeerRegistry&&) = delete;

    /**
     * Installs a connection for a role. A connection already registered for the role is closed and returned.
     * @param role The role the connection takes.
     * @param connection The connection. Must not be null.
     * @param info Information about the peer.
     * @return The replaced connection, or nullptr if the role was vacant.
     */
    std::shared_ptr<PeerConnection>
    register_connection(Role role, std::shared_ptr<PeerConnection> connection, PeerInfo info);

    /**
     * @param role The role.
     * @return The live connection of given role, or nullptr.
     */
    [[nodiscard]] std::shared_ptr<PeerConnection> current(Role role) const;

    /**
     * Removes the entry of a role, but only when it still holds given connection. A connection that was replaced
     * therefore can't clear its successor.
     * @param role The role.
     * @param connection The connection that went away.
     * @return True if the entry was cleared.
     */
    bool clear(Role role, const PeerConnection& connection);

    /**
     * Closes and removes all connections.
     */
    void close_all();

    /**
     * @param role The role.
     * @return True if a connection is registered for the role.
     */
    [[nodiscard]] bool is_connected(Role role) const;

    /**
     * @param role The role.
     * @return The remote address of the registered peer, or an empty string.
     */
    [[nodiscard]] std::string remote_address(Role role) const;

    /**
     * @param role The role.
     * @return The info of the registered peer, if any.
     */
    [[nodiscard]] std::optional<PeerInfo> info(Role role) const;

    /**
     * Adds a subscriber. The subscriber is told about the currently registered peers right away.
     * @param subscriber The subscriber to add.
     * @return True if the subscriber was added, false if it was already subscribed.
     */
    [[nodiscard]] bool subscribe(Subscriber* subscriber);

    /**
     * Removes a subscriber.
     * @param subscriber The subscriber to remove.
     * @return True if the subscriber was removed.
     */
    [[nodiscard]] bool unsubscribe(const Subscriber* subscriber);

  private:
    struct Entry {
        std::shared_ptr<PeerConnection> connection;
        PeerInfo info;
    };

    // Lock order is subscribers_mutex_, then mutex_. Changes hold subscribers_mutex_ until their notification went
    // out, so notifications arrive in the order of the state changes.
    std::mutex subscribers_mutex_;
    SubscriberList<Subscriber> subscribers_;

    mutable std::mutex mutex_;
    std::array<Entry, std::size(k_all_roles)> entries_ {};

    static size_t index_of(Role role);
};

}  // namespace rly
