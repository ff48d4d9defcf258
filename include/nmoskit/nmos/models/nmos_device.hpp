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

#include <boost/uuid/uuid.hpp>

namespace nmk::nmos {

/**
 * Describes a Device. A Device is a logical functional block of a Node which owns Senders and Receivers.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/device.html
 */
struct Device: Resource {
    static constexpr auto k_type_generic = "urn:x-nmos:device:generic";
    static constexpr auto k_type_pipeline = "urn:x-nmos:device:pipeline";

    struct Control {
        /// URL to reach a control endpoint, whether http or otherwise
        std::string href;

        /// URN identifying the control format
        std::string type;

        /// This endpoint requires authorization
        bool authorization {false};
    };

    /// Device type URN
    std::string type {k_type_generic};

    /// Globally unique identifier for the Node which initially created the Device.
    boost::uuids::uuid node_id {};

    /// UUIDs of Senders attached to the Device. Maintained by the Model.
    std::vector<boost::uuids::uuid> senders;

    /// UUIDs of Receivers attached to the Device. Maintained by the Model.
    std::vector<boost::uuids::uuid> receivers;

    /// Control endpoints exposed for the Device
    std::vector<Control> controls;
};

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Device::Control& control) {
    jv = {{"href", control.href}, {"type", control.type}, {"authorization", control.authorization}};
}

inline Device::Control tag_invoke(const boost::json::value_to_tag<Device::Control>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Device::Control control;
    control.href = object.at("href").as_string();
    control.type = object.at("type").as_string();
    if (const auto* authorization = object.if_contains("authorization")) {
        control.authorization = authorization->as_bool();
    }
    return control;
}

inline void tag_invoke(const boost::json::value_from_tag& tag, boost::json::value& jv, const Device& device) {
    tag_invoke(tag, jv, static_cast<const Resource&>(device));
    auto& object = jv.as_object();
    object["type"] = device.type;
    object["node_id"] = boost::uuids::to_string(device.node_id);
    object["senders"] = json_array_from_uuids(device.senders);
    object["receivers"] = json_array_from_uuids(device.receivers);
    object["controls"] = boost::json::value_from(device.controls);
}

inline Device tag_invoke(const boost::json::value_to_tag<Device>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Device device;
    resource_from_json(object, device);
    device.type = object.at("type").as_string();
    device.node_id = required_uuid_from_json(object.at("node_id"), "node_id");
    device.senders = uuids_from_json_array(object.at("senders"), "senders");
    device.receivers = uuids_from_json_array(object.at("receivers"), "receivers");
    device.controls = boost::json::value_to<std::vector<Device::Control>>(object.at("controls"));
    return device;
}

}  // namespace nmk::nmos
