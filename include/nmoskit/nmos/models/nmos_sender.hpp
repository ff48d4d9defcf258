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
 * Describes a sender.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/sender.html
 */
struct Sender: Resource {
    struct Subscription {
        /// UUID of the Receiver to which this Sender is currently configured to send data. Only set if it is active,
        /// uses a unicast push-based transport and is sending to an NMOS Receiver.
        std::optional<boost::uuids::uuid> receiver_id;

        /// Sender is enabled and configured to send data
        bool active {false};
    };

    /// ID of the Flow currently passing via this Sender. Null when no Flow is attached.
    std::optional<boost::uuids::uuid> flow_id;

    /// Transport type used by the Sender
    Transport transport {Transport::rtp_multicast};

    /// Device ID which this Sender forms part of.
    boost::uuids::uuid device_id {};

    /// HTTP(S) accessible URL to a file describing how to connect to the Sender. Null when the transport type does not
    /// require a manifest or while the Sender is inactive.
    std::optional<std::string> manifest_href;

    /// Binding of Sender egress ports to interfaces on the parent Node.
    std::vector<std::string> interface_bindings;

    /// Object containing the 'receiver_id' currently configured to receive from this Sender.
    Subscription subscription;
};

inline void
tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Sender::Subscription& subscription) {
    jv = {
        {"receiver_id", json_value_from_uuid(subscription.receiver_id)},
        {"active", subscription.active},
    };
}

inline Sender::Subscription
tag_invoke(const boost::json::value_to_tag<Sender::Subscription>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Sender::Subscription subscription;
    subscription.receiver_id = uuid_from_json(object.at("receiver_id"));
    subscription.active = object.at("active").as_bool();
    return subscription;
}

inline void tag_invoke(const boost::json::value_from_tag& tag, boost::json::value& jv, const Sender& sender) {
    tag_invoke(tag, jv, static_cast<const Resource&>(sender));
    auto& object = jv.as_object();
    object["flow_id"] = json_value_from_uuid(sender.flow_id);
    object["transport"] = to_urn(sender.transport);
    object["device_id"] = boost::uuids::to_string(sender.device_id);
    if (sender.manifest_href) {
        object["manifest_href"] = *sender.manifest_href;
    } else {
        object["manifest_href"] = nullptr;
    }
    object["interface_bindings"] = boost::json::value_from(sender.interface_bindings);
    object["subscription"] = boost::json::value_from(sender.subscription);
}

inline Sender tag_invoke(const boost::json::value_to_tag<Sender>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Sender sender;
    resource_from_json(object, sender);
    sender.flow_id = uuid_from_json(object.at("flow_id"));

    const auto transport = transport_from_urn(object.at("transport").as_string());
    if (!transport) {
        throw std::invalid_argument("transport is not a supported transport URN");
    }
    sender.transport = *transport;

    sender.device_id = required_uuid_from_json(object.at("device_id"), "device_id");
    if (const auto* manifest_href = object.at("manifest_href").if_string()) {
        sender.manifest_href = std::string(*manifest_href);
    }
    sender.interface_bindings = boost::json::value_to<std::vector<std::string>>(object.at("interface_bindings"));
    sender.subscription = boost::json::value_to<Sender::Subscription>(object.at("subscription"));
    return sender;
}

}  // namespace nmk::nmos
