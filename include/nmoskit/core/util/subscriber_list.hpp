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

#include "nmoskit/core/assert.hpp"

#include <vector>

namespace nmk {

/**
 * Super basic list of subscribers.
 * This class is not thread safe and make sure that the subscriber is not destroyed while it is in the list.
 * @tparam T The type of the subscriber.
 */
template<class T>
class SubscriberList {
  public:
    SubscriberList() = default;

    ~SubscriberList() {
        NMK_ASSERT_NO_THROW(
            subscribers_.empty(),
            "Subscriber list is not empty, this is a strong indication that the lifetime of the subscriber is longer "
            "than the list"
        );
    }

    SubscriberList(const SubscriberList&) = delete;
    SubscriberList& operator=(const SubscriberList&) = delete;

    SubscriberList(SubscriberList&&) = default;
    SubscriberList& operator=(SubscriberList&&) = default;

    auto begin() const {
        return subscribers_.begin();
    }

    auto end() const {
        return subscribers_.end();
    }

    /**
     * Adds the given subscriber to the list.
     * @param subscriber The subscriber to add.
     * @return true if the subscriber was added, or false if it was already in the list.
     */
    [[nodiscard]] bool add(T* subscriber) {
        if (contains(subscriber)) {
            return false;
        }
        subscribers_.push_back(subscriber);
        return true;
    }

    /**
     * Removes the given subscriber from the list.
     * @param subscriber The subscriber to remove.
     * @return true if the subscriber was removed, or false if it was not in the list.
     */
    [[nodiscard]] bool remove(const T* subscriber) {
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (*it == subscriber) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    /**
     * Clears the list.
     */
    void clear() {
        subscribers_.clear();
    }

    /**
     * Calls given function for each subscriber. Iterates over a copy, so subscribers may unsubscribe from within f.
     * @param f The function to call for each subscriber.
     */
    template<class F>
    void foreach (F&& f) const {
        const auto subscribers = subscribers_;
        for (auto* subscriber : subscribers) {
            f(subscriber);
        }
    }

    /**
     * @returns The number of subscribers.
     */
    [[nodiscard]] size_t size() const {
        return subscribers_.size();
    }

    /**
     * @return true if there are no subscribers.
     */
    [[nodiscard]] bool empty() const {
        return subscribers_.empty();
    }

    /**
     * @return true if the list contains the subscriber, or false if not.
     */
    [[nodiscard]] bool contains(const T* subscriber) const {
        for (const auto* sub : subscribers_) {
            if (sub == subscriber) {
                return true;
            }
        }
        return false;
    }

  private:
    std::vector<T*> subscribers_;
};

}  // namespace nmk
