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

#include "relaykit/relay/peer_connection.hpp"
#include "relaykit/wire/wire_codec.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rly::test {

/**
 * In-memory PeerConnection. Messages pushed with push_incoming() are returned by receive(), messages sent are recorded
 * and optionally forwarded to on_send.
 */
class FakePeerConnection final: public PeerConnection {
  public:
    explicit FakePeerConnection(std::string address = "fake:0") : address_(std::move(address)) {}

    tl::expected<void, Error> send(const std::string& encoded) override {
        std::function<void(const std::string&)> on_send;
        {
            std::lock_guard lock(mutex_);
            if (!alive_ || fail_sends_) {
                return tl::unexpected(Error::connection_lost);
            }
            sent_.push_back(encoded);
            on_send = on_send_;
        }
        if (on_send) {
            on_send(encoded);
        }
        return {};
    }

    tl::expected<std::string, Error> receive() override {
        std::unique_lock lock(mutex_);
        condition_.wait(lock, [this] {
            return !incoming_.empty() || !alive_;
        });
        if (!alive_) {
            return tl::unexpected(Error::connection_lost);
        }
        auto message = std::move(incoming_.front());
        incoming_.pop_front();
        return message;
    }

    void close() override {
        {
            std::lock_guard lock(mutex_);
            alive_ = false;
        }
        condition_.notify_all();
    }

    [[nodiscard]] bool is_alive() const override {
        std::lock_guard lock(mutex_);
        return alive_;
    }

    [[nodiscard]] std::string remote_address() const override {
        return address_;
    }

    void push_incoming(std::string message) {
        {
            std::lock_guard lock(mutex_);
            incoming_.push_back(std::move(message));
        }
        condition_.notify_all();
    }

    template<class T>
    void push_message(const T& message) {
        auto encoded = wire::encode(message);
        encoded.pop_back();
        push_incoming(std::move(encoded));
    }

    void set_on_send(std::function<void(const std::string&)> on_send) {
        std::lock_guard lock(mutex_);
        on_send_ = std::move(on_send);
    }

    void set_fail_sends(const bool fail) {
        std::lock_guard lock(mutex_);
        fail_sends_ = fail;
    }

    [[nodiscard]] std::vector<std::string> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

  private:
    std::string address_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::string> incoming_;
    std::vector<std::string> sent_;
    std::function<void(const std::string&)> on_send_;
    bool alive_ {true};
    bool fail_sends_ {false};
};

/**
 * Polls a condition until it holds or the timeout expires.
 * @return The last result of the condition.
 */
template<class Condition>
bool wait_until(Condition condition, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return condition();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}  // namespace rly::test
