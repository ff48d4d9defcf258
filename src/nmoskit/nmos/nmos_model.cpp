/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/nmos_model.hpp"

#include "nmoskit/core/assert.hpp"

nmk::nmos::Model::Model(std::shared_ptr<TimeSource> time_source) : time_source_(std::move(time_source)) {
    NMK_ASSERT(time_source_ != nullptr, "A time source is required");
}

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Model::insert(const Self& self) {
    if (self.id.is_nil()) {
        return Error::constraint_violation;
    }
    if (!nodes_.insert(std::make_shared<ResourceStore<Self>::Entry>(self, boost::uuids::uuid {}))) {
        NMK_WARNING("Rejected node {}: a node already exists", boost::uuids::to_string(self.id));
        return Error::constraint_violation;
    }
    return {};
}

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Model::insert(const Device& device) {
    if (device.id.is_nil() || !device.senders.empty() || !device.receivers.empty()) {
        return Error::constraint_violation;
    }
    const auto node = nodes_.find(device.node_id);
    if (node == nullptr) {
        NMK_WARNING("Rejected device {}: node {} doesn't exist",
            boost::uuids::to_string(device.id), boost::uuids::to_string(device.node_id));
        return Error::constraint_violation;
    }
    std::shared_lock node_lock(node->mutex);
    if (node->removed) {
        return Error::constraint_violation;
    }
    if (!devices_.insert(std::make_shared<ResourceStore<Device>::Entry>(device, device.node_id))) {
        return Error::constraint_violation;
    }
    return {};
}

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Model::insert(const Sender& sender) {
    return insert_device_child(sender, &Device::senders);
}

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Model::insert(const Receiver& receiver) {
    return insert_device_child(receiver, &Device::receivers);
}

boost::system::result<nmk::nmos::Self, nmk::nmos::Error> nmk::nmos::Model::get_self() const {
    auto nodes = list<Self>();
    if (nodes.empty()) {
        return Error::not_found;
    }
    return std::move(nodes.front());
}

boost::system::result<void, nmk::nmos::Error>
nmk::nmos::Model::remove_device(const boost::uuids::uuid& id, const RemoveMode mode) {
    const auto entry = devices_.find(id);
    if (entry == nullptr) {
        return Error::not_found;
    }

    {
        std::unique_lock lock(entry->mutex);
        if (entry->removed) {
            return Error::not_found;
        }
        const auto has_children = !entry->resource.senders.empty() || !entry->resource.receivers.empty();
        if (has_children && mode == RemoveMode::restrict) {
            return Error::constraint_violation;
        }
        // From here on no children can be added.
        entry->removed = true;
    }

    for (const auto& sender_id : senders_.children_of(id)) {
        if (!remove_device_child<Sender>(sender_id, &Device::senders)) {
            NMK_TRACE("Sender {} was removed concurrently", boost::uuids::to_string(sender_id));
        }
    }
    for (const auto& receiver_id : receivers_.children_of(id)) {
        if (!remove_device_child<Receiver>(receiver_id, &Device::receivers)) {
            NMK_TRACE("Receiver {} was removed concurrently", boost::uuids::to_string(receiver_id));
        }
    }

    devices_.erase(id);
    NMK_DEBUG("Removed device {}", boost::uuids::to_string(id));
    return {};
}

boost::system::result<void, nmk::nmos::Error>
nmk::nmos::Model::remove_self(const boost::uuids::uuid& id, const RemoveMode mode) {
    const auto entry = nodes_.find(id);
    if (entry == nullptr) {
        return Error::not_found;
    }

    {
        std::unique_lock lock(entry->mutex);
        if (entry->removed) {
            return Error::not_found;
        }
        if (mode == RemoveMode::restrict && !devices_.children_of(id).empty()) {
            return Error::constraint_violation;
        }
        entry->removed = true;
    }

    for (const auto& device_id : devices_.children_of(id)) {
        if (!remove_device(device_id, RemoveMode::cascade)) {
            NMK_TRACE("Device {} was removed concurrently", boost::uuids::to_string(device_id));
        }
    }

    nodes_.erase(id);
    NMK_DEBUG("Removed node {}", boost::uuids::to_string(id));
    return {};
}
