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

#include "nmos_resource.hpp"
#include "nmoskit/nmos/detail/nmos_media_types.hpp"

#include <boost/uuid/uuid.hpp>

#include <optional>

namespace nmk::nmos {

/**
 * Describes a receiver.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/receiver_core.html
 */
struct Receiver: Resource {
    struct Caps {
        /// Media types accepted by the Receiver, i.e. "audio/L24". Omitted when empty.
        std::vector<std::string> media_types;
    };

    struct Subscription {
        /// UUID of the Sender from which this Receiver is currently configured to receive data. Null when not
        /// connected to an NMOS Sender.
        std::optional<boost::uuids::uuid> sender_id;

        /// Receiver is enabled and configured with a Sender's connection parameters
        bool active {false};
    };

    /// Type of Flow accepted by the Receiver
    Format format {Format::audio};

    /// Capabilities
    Caps caps;

    /// Device ID which this Receiver forms part of.
    boost::uuids::uuid device_id {};

    /// Transport type accepted by the Receiver
    Transport transport {Transport::rtp_multicast};

    /// Binding of Receiver ingress ports to interfaces on the parent Node.
    std::vector<std::string> interface_bindings;

    /// Object containing the 'sender_id' currently subscribed to.
    Subscription subscription;
};

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Receiver::Caps& caps) {
    jv = boost::json::object();
    if (!caps.media_types.empty()) {
        jv.as_object()["media_types"] = boost::json::value_from(caps.media_types);
    }
}

inline Receiver::Caps tag_invoke(const boost::json::value_to_tag<Receiver::Caps>&, const boost::json::value& jv) {
    Receiver::Caps caps;
    if (const auto* media_types = jv.as_object().if_contains("media_types")) {
        caps.media_types = boost::json::value_to<std::vector<std::string>>(*media_types);
    }
    return caps;
}

inline void
tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Receiver::Subscription& subscription) {
    jv = {
        {"sender_id", json_value_from_uuid(subscription.sender_id)},
        {"active", subscription.active},
    };
}

inline Receiver::Subscription
tag_invoke(const boost::json::value_to_tag<Receiver::Subscription>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Receiver::Subscription subscription;
    subscription.sender_id = uuid_from_json(object.at("sender_id"));
    subscription.active = object.at("active").as_bool();
    return subscription;
}

inline void tag_invoke(const boost::json::value_from_tag& tag, boost::json::value& jv, const Receiver& receiver) {
    tag_invoke(tag, jv, static_cast<const Resource&>(receiver));
    auto& object = jv.as_object();
    object["format"] = to_urn(receiver.format);
    object["caps"] = boost::json::value_from(receiver.caps);
    object["device_id"] = boost::uuids::to_string(receiver.device_id);
    object["transport"] = to_urn(receiver.transport);
    object["interface_bindings"] = boost::json::value_from(receiver.interface_bindings);
    object["subscription"] = boost::json::value_from(receiver.subscription);
}

inline Receiver tag_invoke(const boost::json::value_to_tag<Receiver>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Receiver receiver;
    resource_from_json(object, receiver);

    const auto format = format_from_urn(object.at("format").as_string());
    if (!format) {
        throw std::invalid_argument("format is not a supported format URN");
    }
    receiver.format = *format;

    const auto transport = transport_from_urn(object.at("transport").as_string());
    if (!transport) {
        throw std::invalid_argument("transport is not a supported transport URN");
    }
    receiver.transport = *transport;

    receiver.caps = boost::json::value_to<Receiver::Caps>(object.at("caps"));
    receiver.device_id = required_uuid_from_json(object.at("device_id"), "device_id");
    receiver.interface_bindings = boost::json::value_to<std::vector<std::string>>(object.at("interface_bindings"));
    receiver.subscription = boost::json::value_to<Receiver::Subscription>(object.at("subscription"));
    return receiver;
}

}  // namespace nmk::nmos
