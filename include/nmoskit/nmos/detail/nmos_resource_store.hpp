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

#include "nmoskit/core/util/stl_helpers.hpp"

#include <boost/uuid/uuid.hpp>

#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace nmk::nmos {

/**
 * Index of the resources of one kind. The index has its own lock which is only held while looking up, adding or
 * removing entries. Each entry carries the lock which guards the resource itself, so readers of different resources
 * never wait for each other and readers of the same resource only wait for a writer of that resource.
 * @tparam T The resource type.
 */
template<class T>
class ResourceStore {
  public:
    struct Entry {
        Entry(T resource_, const boost::uuids::uuid& parent_id_) :
            resource(std::move(resource_)), parent_id(parent_id_) {}

        mutable std::shared_mutex mutex;
        T resource;  // Guarded by mutex
        const boost::uuids::uuid parent_id;
        bool removed {false};  // Guarded by mutex
    };

    /**
     * @param capacity The maximum number of entries the store accepts.
     */
    explicit ResourceStore(const size_t capacity = std::numeric_limits<size_t>::max()) : capacity_(capacity) {}

    /**
     * @param id The id of the resource.
     * @return The entry, or nullptr if no entry with the given id exists.
     */
    [[nodiscard]] std::shared_ptr<Entry> find(const boost::uuids::uuid& id) const {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(id);
        if (it == entries_.end()) {
            return nullptr;
        }
        return it->second;
    }

    /**
     * Adds an entry at the end of the insertion order.
     * @param entry The entry to add.
     * @return True if the entry was added, false if an entry with the same id exists or the store is full.
     */
    [[nodiscard]] bool insert(std::shared_ptr<Entry> entry) {
        std::unique_lock lock(mutex_);
        if (entries_.size() >= capacity_) {
            return false;
        }
        const auto id = entry->resource.id;
        if (!entries_.emplace(id, std::move(entry)).second) {
            return false;
        }
        order_.push_back(id);
        return true;
    }

    /**
     * Removes an entry from the index. Holders of the entry keep it alive.
     * @param id The id of the entry to remove.
     * @return True if the entry was removed, false if it didn't exist.
     */
    bool erase(const boost::uuids::uuid& id) {
        std::unique_lock lock(mutex_);
        if (entries_.erase(id) == 0) {
            return false;
        }
        stl_remove_if(order_, [&id](const boost::uuids::uuid& other) {
            return other == id;
        });
        return true;
    }

    /**
     * @return All entries in insertion order.
     */
    [[nodiscard]] std::vector<std::shared_ptr<Entry>> entries() const {
        std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<Entry>> result;
        result.reserve(order_.size());
        for (const auto& id : order_) {
            result.push_back(entries_.at(id));
        }
        return result;
    }

    /**
     * @param parent_id The id of the parent resource.
     * @return The ids of the entries which reference the given parent, in insertion order.
     */
    [[nodiscard]] std::vector<boost::uuids::uuid> children_of(const boost::uuids::uuid& parent_id) const {
        std::shared_lock lock(mutex_);
        std::vector<boost::uuids::uuid> result;
        for (const auto& id : order_) {
            if (entries_.at(id)->parent_id == parent_id) {
                result.push_back(id);
            }
        }
        return result;
    }

    /**
     * @return The number of entries in the index.
     */
    [[nodiscard]] size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

  private:
    const size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::map<boost::uuids::uuid, std::shared_ptr<Entry>> entries_;
    std::vector<boost::uuids::uuid> order_;
};

}  // namespace nmk::nmos
