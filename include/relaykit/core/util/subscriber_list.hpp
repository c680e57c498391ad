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

#include "../assert.hpp"

#include <algorithm>
#include <vector>

namespace rly {

/**
 * Observers of a component, held as non-owning pointers. Not synchronised: the owner guards the list with the lock
 * that protects the state being observed, so subscribers see changes in order.
 * @tparam T The subscriber interface.
 */
template<class T>
class SubscriberList {
  public:
    SubscriberList() = default;

    ~SubscriberList() {
        RLY_ASSERT_NO_THROW(subscribers_.empty(), "Subscribers must unsubscribe before the observed object is destroyed");
    }

    SubscriberList(const SubscriberList&) = delete;
    SubscriberList& operator=(const SubscriberList&) = delete;

    SubscriberList(SubscriberList&&) = delete;
    SubscriberList& operator=(SubscriberList&&) = delete;

    /**
     * @param subscriber The subscriber to add.
     * @return False if subscriber is null or already subscribed.
     */
    [[nodiscard]] bool add(T* subscriber) {
        if (subscriber == nullptr || contains(subscriber)) {
            return false;
        }
        subscribers_.push_back(subscriber);
        return true;
    }

    /**
     * @param subscriber The subscriber to remove.
     * @return False if subscriber was not subscribed.
     */
    [[nodiscard]] bool remove(const T* subscriber) {
        const auto size_before = subscribers_.size();
        subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscriber), subscribers_.end());
        return subscribers_.size() != size_before;
    }

    /**
     * Invokes a member function of the subscriber interface on every subscriber, in subscription order.
     * @param method The callback, for example &T::on_peer_connected.
     * @param args The arguments passed to every invocation.
     */
    template<class Method, class... Args>
    void notify(Method method, const Args&... args) const {
        for (auto* subscriber : subscribers_) {
            (subscriber->*method)(args...);
        }
    }

    [[nodiscard]] bool contains(const T* subscriber) const {
        return std::find(subscribers_.begin(), subscribers_.end(), subscriber) != subscribers_.end();
    }

    [[nodiscard]] size_t size() const {
        return subscribers_.size();
    }

    [[nodiscard]] bool empty() const {
        return subscribers_.empty();
    }

  private:
    std::vector<T*> subscribers_;
};

}  // namespace rly
