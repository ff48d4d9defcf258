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

#include "detail/nmos_error.hpp"
#include "detail/nmos_resource_store.hpp"
#include "detail/nmos_time_source.hpp"
#include "models/nmos_device.hpp"
#include "models/nmos_receiver.hpp"
#include "models/nmos_self.hpp"
#include "models/nmos_sender.hpp"

#include "nmoskit/core/log.hpp"

#include <boost/system/result.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace nmk::nmos {

/**
 * The resource graph of a Node: the Node itself (Self), its Devices and their Senders and Receivers. The model is the
 * single owner of the resources. Relations between resources are expressed by ids.
 *
 * All operations are thread safe. The model has no global lock: each kind has an index with its own lock, and each
 * resource has its own reader/writer lock. Mutations of a resource are serialized, reads never wait for other reads.
 * When locks of several resources are held at once they are taken parent first.
 *
 * Resources are copied in and out. The templated operations accept Self, Device, Sender and Receiver.
 */
class Model {
  public:
    enum class RemoveMode {
        /// Removing a resource which has children fails.
        restrict,
        /// Children are removed first, depth first, before the resource itself.
        cascade,
    };

    /**
     * @param time_source The source used to stamp the version of updated resources.
     */
    explicit Model(std::shared_ptr<TimeSource> time_source = std::make_shared<TaiClock>());

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    Model(Model&&) = delete;
    Model& operator=(Model&&) = delete;

    /**
     * Inserts the Node resource. Only one Node can exist.
     * @param self The Node resource.
     * @return constraint_violation if a Node already exists or the id is nil.
     */
    [[nodiscard]] boost::system::result<void, Error> insert(const Self& self);

    /**
     * Inserts a Device. The senders and receivers lists must be empty, they are maintained by the model.
     * @param device The Device.
     * @return constraint_violation if the Node referenced by node_id doesn't exist, the id is taken, or the lists of
     * senders or receivers are not empty.
     */
    [[nodiscard]] boost::system::result<void, Error> insert(const Device& device);

    /**
     * Inserts a Sender and adds its id to the senders of its Device.
     * @param sender The Sender.
     * @return constraint_violation if the Device referenced by device_id doesn't exist or the id is taken.
     */
    [[nodiscard]] boost::system::result<void, Error> insert(const Sender& sender);

    /**
     * Inserts a Receiver and adds its id to the receivers of its Device.
     * @param receiver The Receiver.
     * @return constraint_violation if the Device referenced by device_id doesn't exist or the id is taken.
     */
    [[nodiscard]] boost::system::result<void, Error> insert(const Receiver& receiver);

    /**
     * @tparam T The resource type.
     * @param id The id of the resource.
     * @return A copy of the resource, or not_found.
     */
    template<class T>
    [[nodiscard]] boost::system::result<T, Error> get(const boost::uuids::uuid& id) const;

    /**
     * @return A copy of the Node resource, or not_found if it wasn't inserted yet.
     */
    [[nodiscard]] boost::system::result<Self, Error> get_self() const;

    /**
     * Mutates a resource while holding its exclusive lock. The mutator works on a copy which replaces the resource
     * when the mutator returns, so readers never see a partial write. The version is updated afterward.
     * @tparam T The resource type.
     * @param id The id of the resource.
     * @param mutator Function which mutates the resource.
     * @return not_found if the resource doesn't exist. constraint_violation if the mutator changed the id, the
     * reference to the parent, or the list of children. In that case the resource is left untouched.
     */
    template<class T>
    [[nodiscard]] boost::system::result<void, Error>
    update(const boost::uuids::uuid& id, const std::function<void(T&)>& mutator);

    /**
     * Removes a resource. Removing a Sender or Receiver also removes its id from its Device.
     * @tparam T The resource type.
     * @param id The id of the resource.
     * @param mode Whether children should be removed as well.
     * @return not_found if the resource doesn't exist. constraint_violation if the resource has children and mode is
     * restrict.
     */
    template<class T>
    [[nodiscard]] boost::system::result<void, Error>
    remove(const boost::uuids::uuid& id, RemoveMode mode = RemoveMode::restrict);

    /**
     * @tparam T The resource type.
     * @return Copies of all resources of the given type, in insertion order.
     */
    template<class T>
    [[nodiscard]] std::vector<T> list() const;

    /**
     * @tparam T The resource type.
     * @return The number of resources of the given type.
     */
    template<class T>
    [[nodiscard]] size_t count() const;

  private:
    std::shared_ptr<TimeSource> time_source_;
    ResourceStore<Self> nodes_ {1};
    ResourceStore<Device> devices_;
    ResourceStore<Sender> senders_;
    ResourceStore<Receiver> receivers_;

    template<class T>
    ResourceStore<T>& store();

    template<class T>
    const ResourceStore<T>& store() const;

    template<class T>
    boost::system::result<void, Error>
    insert_device_child(const T& child, std::vector<boost::uuids::uuid> Device::*children);

    template<class T>
    boost::system::result<void, Error>
    remove_device_child(const boost::uuids::uuid& id, std::vector<boost::uuids::uuid> Device::*children);

    boost::system::result<void, Error> remove_device(const boost::uuids::uuid& id, RemoveMode mode);
    boost::system::result<void, Error> remove_self(const boost::uuids::uuid& id, RemoveMode mode);
};

namespace detail {

inline boost::uuids::uuid parent_id_of(const Self&) {
    return {};
}

inline boost::uuids::uuid parent_id_of(const Device& device) {
    return device.node_id;
}

inline boost::uuids::uuid parent_id_of(const Sender& sender) {
    return sender.device_id;
}

inline boost::uuids::uuid parent_id_of(const Receiver& receiver) {
    return receiver.device_id;
}

template<class T>
bool has_same_children(const T&, const T&) {
    return true;
}

inline bool has_same_children(const Device& lhs, const Device& rhs) {
    return lhs.senders == rhs.senders && lhs.receivers == rhs.receivers;
}

}  // namespace detail

template<class T>
ResourceStore<T>& Model::store() {
    return const_cast<ResourceStore<T>&>(std::as_const(*this).store<T>());
}

template<class T>
const ResourceStore<T>& Model::store() const {
    if constexpr (std::is_same_v<T, Self>) {
        return nodes_;
    } else if constexpr (std::is_same_v<T, Device>) {
        return devices_;
    } else if constexpr (std::is_same_v<T, Sender>) {
        return senders_;
    } else {
        static_assert(std::is_same_v<T, Receiver>, "Unsupported resource type");
        return receivers_;
    }
}

template<class T>
boost::system::result<T, Error> Model::get(const boost::uuids::uuid& id) const {
    const auto entry = store<T>().find(id);
    if (entry == nullptr) {
        return Error::not_found;
    }
    std::shared_lock lock(entry->mutex);
    if (entry->removed) {
        return Error::not_found;
    }
    return entry->resource;
}

template<class T>
boost::system::result<void, Error>
Model::update(const boost::uuids::uuid& id, const std::function<void(T&)>& mutator) {
    const auto entry = store<T>().find(id);
    if (entry == nullptr) {
        return Error::not_found;
    }
    std::unique_lock lock(entry->mutex);
    if (entry->removed) {
        return Error::not_found;
    }

    T updated = entry->resource;
    mutator(updated);

    if (updated.id != entry->resource.id || detail::parent_id_of(updated) != entry->parent_id
        || !detail::has_same_children(updated, entry->resource)) {
        NMK_WARNING("Rejected update of {}: identity and relations can't be changed", boost::uuids::to_string(id));
        return Error::constraint_violation;
    }

    updated.version = entry->resource.version;
    updated.version.update(time_source_->now());
    entry->resource = std::move(updated);
    return {};
}

template<class T>
boost::system::result<void, Error> Model::remove(const boost::uuids::uuid& id, const RemoveMode mode) {
    if constexpr (std::is_same_v<T, Self>) {
        return remove_self(id, mode);
    } else if constexpr (std::is_same_v<T, Device>) {
        return remove_device(id, mode);
    } else if constexpr (std::is_same_v<T, Sender>) {
        return remove_device_child<Sender>(id, &Device::senders);
    } else {
        static_assert(std::is_same_v<T, Receiver>, "Unsupported resource type");
        return remove_device_child<Receiver>(id, &Device::receivers);
    }
}

template<class T>
std::vector<T> Model::list() const {
    std::vector<T> resources;
    for (const auto& entry : store<T>().entries()) {
        std::shared_lock lock(entry->mutex);
        if (!entry->removed) {
            resources.push_back(entry->resource);
        }
    }
    return resources;
}

template<class T>
size_t Model::count() const {
    size_t n = 0;
    for (const auto& entry : store<T>().entries()) {
        std::shared_lock lock(entry->mutex);
        if (!entry->removed) {
            ++n;
        }
    }
    return n;
}

template<class T>
boost::system::result<void, Error>
Model::insert_device_child(const T& child, std::vector<boost::uuids::uuid> Device::*children) {
    if (child.id.is_nil()) {
        return Error::constraint_violation;
    }
    const auto device = devices_.find(child.device_id);
    if (device == nullptr) {
        return Error::constraint_violation;
    }
    std::unique_lock device_lock(device->mutex);
    if (device->removed) {
        return Error::constraint_violation;
    }
    if (!store<T>().insert(std::make_shared<typename ResourceStore<T>::Entry>(child, child.device_id))) {
        return Error::constraint_violation;
    }
    (device->resource.*children).push_back(child.id);
    return {};
}

template<class T>
boost::system::result<void, Error>
Model::remove_device_child(const boost::uuids::uuid& id, std::vector<boost::uuids::uuid> Device::*children) {
    const auto entry = store<T>().find(id);
    if (entry == nullptr) {
        return Error::not_found;
    }

    const auto device = devices_.find(entry->parent_id);
    std::unique_lock<std::shared_mutex> device_lock;
    if (device != nullptr) {
        device_lock = std::unique_lock(device->mutex);
    }

    {
        std::unique_lock lock(entry->mutex);
        if (entry->removed) {
            return Error::not_found;
        }
        entry->removed = true;
    }

    if (device != nullptr) {
        stl_remove_if(device->resource.*children, [&id](const boost::uuids::uuid& other) {
            return other == id;
        });
    }
    store<T>().erase(id);
    return {};
}

}  // namespace nmk::nmos
