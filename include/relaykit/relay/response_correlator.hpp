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

#include "relaykit/wire/wire_messages.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace rly {

/**
 * Hands acknowledgements from the actuation reader thread over to the relay loop. One producer publishes, one consumer
 * awaits. Only one await may be outstanding at any time.
 */
class ResponseCorrelator {
  public:
    static constexpr std::chrono::milliseconds k_default_timeout {2000};

    ResponseCorrelator() = default;

    ResponseCorrelator(const ResponseCorrelator&) = delete;
    ResponseCorrelator& operator=(const ResponseCorrelator&) = delete;

    ResponseCorrelator(ResponseCorrelator&&) = delete;
    ResponseCorrelator& operator=(ResponseCorrelator&&) = delete;

    /**
     * Enqueues an acknowledgement and wakes up a waiting consumer. Never blocks on the consumer and never drops.
     * @param ack The acknowledgement.
     */
    void publish(wire::Acknowledgement ack);

    /**
     * Removes and returns the oldest acknowledgement, waiting for one to arrive if the queue is empty.
     * @param timeout The maximum time to wait.
     * @return The acknowledgement, or nullopt when none arrived within the timeout.
     */
    [[nodiscard]] std::optional<wire::Acknowledgement> await_next(std::chrono::milliseconds timeout = k_default_timeout);

    /**
     * Waits for the acknowledgement of given request. Acknowledgements carrying an older request id are late replies
     * to requests that already timed out and get discarded. Acknowledgements carrying a newer id stay queued.
     * Acknowledgements without a request id are taken in arrival order, which is only correct as long as a single
     * command is in flight.
     * @param request_id The request id of the command in flight.
     * @param timeout The maximum time to wait.
     * @return The acknowledgement, or nullopt when it didn't arrive within the timeout.
     */
    [[nodiscard]] std::optional<wire::Acknowledgement>
    await_response(uint64_t request_id, std::chrono::milliseconds timeout = k_default_timeout);

    /**
     * Discards all pending acknowledgements.
     */
    void clear();

    /**
     * @return The number of pending acknowledgements.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @return The number of acknowledgements discarded as stale since construction.
     */
    [[nodiscard]] uint64_t num_discarded() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<wire::Acknowledgement> queue_;
    uint64_t num_discarded_ {};
    std::atomic<bool> awaiting_ {false};

    std::optional<wire::Acknowledgement> take_response(uint64_t request_id);

    template<class Take>
    std::optional<wire::Acknowledgement> await(std::chrono::milliseconds timeout, Take take);
};

}  // namespace rly
