/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/response_correlator.hpp"

#include "relaykit/core/assert.hpp"
#include "relaykit/core/log.hpp"

void rly::ResponseCorrelator::publish(wire::Acknowledgement ack) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(ack));
    }
    condition_.notify_one();
}

template<class Take>
std::optional<rly::wire::Acknowledgement>
rly::ResponseCorrelator::await(const std::chrono::milliseconds timeout, Take take) {
    const bool was_awaiting = awaiting_.exchange(true);
    RLY_ASSERT(!was_awaiting, "Only one await may be outstanding at a time");

    std::optional<wire::Acknowledgement> result;
    {
        std::unique_lock lock(mutex_);
        condition_.wait_for(lock, timeout, [&] {
            result = take();
            return result.has_value();
        });
    }

    awaiting_ = false;
    return result;
}

std::optional<rly::wire::Acknowledgement> rly::ResponseCorrelator::await_next(const std::chrono::milliseconds timeout) {
    return await(timeout, [this]() -> std::optional<wire::Acknowledgement> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        auto ack = std::move(queue_.front());
        queue_.pop_front();
        return ack;
    });
}

std::optional<rly::wire::Acknowledgement>
rly::ResponseCorrelator::await_response(const uint64_t request_id, const std::chrono::milliseconds timeout) {
    return await(timeout, [this, request_id] {
        return take_response(request_id);
    });
}

void rly::ResponseCorrelator::clear() {
    std::lock_guard lock(mutex_);
    queue_.clear();
}

size_t rly::ResponseCorrelator::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

uint64_t rly::ResponseCorrelator::num_discarded() const {
    std::lock_guard lock(mutex_);
    return num_discarded_;
}

std::optional<rly::wire::Acknowledgement> rly::ResponseCorrelator::take_response(const uint64_t request_id) {
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (!it->request_id || *it->request_id == request_id) {
            auto ack = std::move(*it);
            queue_.erase(it);
            return ack;
        }
        if (*it->request_id < request_id) {
            RLY_WARNING("Discarding late acknowledgement of request {}", *it->request_id);
            num_discarded_++;
            it = queue_.erase(it);
            continue;
        }
        ++it;  // Belongs to a later request
    }
    return std::nullopt;
}
