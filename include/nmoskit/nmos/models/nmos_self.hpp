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

#include <optional>

namespace nmk::nmos {

/**
 * Describes the Node itself. The root of the resource graph.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/node.html
 */
struct Self: Resource {
    struct Endpoint {
        /// IP address or hostname which the Node API is running on
        std::string host;

        /// Port number which the Node API is running on
        uint16_t port {};

        /// Protocol supported by this instance of the Node API
        std::string protocol {"http"};

        friend bool operator==(const Endpoint& lhs, const Endpoint& rhs) {
            return lhs.host == rhs.host && lhs.port == rhs.port && lhs.protocol == rhs.protocol;
        }
    };

    struct Api {
        /// Supported API versions running on this Node
        std::vector<std::string> versions;

        /// Host, port and protocol details required to connect to the API
        std::vector<Endpoint> endpoints;
    };

    struct Interface {
        /// Chassis ID of the interface, as signaled in LLDP from this node. Null where LLDP is unsuitable.
        std::optional<std::string> chassis_id;

        /// Port ID of the interface. Must be a MAC address (e.g. "00-1a-2b-3c-4d-5e").
        std::string port_id;

        /// Name of the interface (unique in the scope of this node).
        std::string name;
    };

    /// HTTP access href for the Node's API (deprecated)
    std::string href;

    /// Node hostname (optional, deprecated)
    std::string hostname;

    /// URL fragments required to connect to the Node API
    Api api;

    /// Network interfaces made available to devices owned by this Node.
    std::vector<Interface> interfaces;
};

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Self::Endpoint& endpoint) {
    jv = {{"host", endpoint.host}, {"port", endpoint.port}, {"protocol", endpoint.protocol}};
}

inline Self::Endpoint tag_invoke(const boost::json::value_to_tag<Self::Endpoint>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Self::Endpoint endpoint;
    endpoint.host = object.at("host").as_string();
    endpoint.port = boost::json::value_to<uint16_t>(object.at("port"));
    endpoint.protocol = object.at("protocol").as_string();
    return endpoint;
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Self::Api& api) {
    jv = {{"versions", boost::json::value_from(api.versions)}, {"endpoints", boost::json::value_from(api.endpoints)}};
}

inline Self::Api tag_invoke(const boost::json::value_to_tag<Self::Api>&, const boost::json::value& jv) {
    Self::Api api;
    api.versions = boost::json::value_to<std::vector<std::string>>(jv.at("versions"));
    api.endpoints = boost::json::value_to<std::vector<Self::Endpoint>>(jv.at("endpoints"));
    return api;
}

inline void
tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Self::Interface& network_interface) {
    jv = {
        {"chassis_id", nullptr},
        {"port_id", network_interface.port_id},
        {"name", network_interface.name},
    };
    if (network_interface.chassis_id) {
        jv.as_object()["chassis_id"] = *network_interface.chassis_id;
    }
}

inline Self::Interface tag_invoke(const boost::json::value_to_tag<Self::Interface>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Self::Interface network_interface;
    if (const auto* chassis_id = object.at("chassis_id").if_string()) {
        network_interface.chassis_id = std::string(*chassis_id);
    }
    network_interface.port_id = object.at("port_id").as_string();
    network_interface.name = object.at("name").as_string();
    return network_interface;
}

inline void tag_invoke(const boost::json::value_from_tag& tag, boost::json::value& jv, const Self& self) {
    tag_invoke(tag, jv, static_cast<const Resource&>(self));
    auto& object = jv.as_object();
    object["href"] = self.href;
    object["hostname"] = self.hostname;
    object["caps"] = boost::json::object();
    object["api"] = boost::json::value_from(self.api);
    object["services"] = boost::json::array();
    object["clocks"] = boost::json::array();
    object["interfaces"] = boost::json::value_from(self.interfaces);
}

inline Self tag_invoke(const boost::json::value_to_tag<Self>&, const boost::json::value& jv) {
    const auto& object = jv.as_object();
    Self self;
    resource_from_json(object, self);
    self.href = object.at("href").as_string();
    if (const auto* hostname = object.if_contains("hostname")) {
        self.hostname = hostname->as_string();
    }
    self.api = boost::json::value_to<Self::Api>(object.at("api"));
    self.interfaces = boost::json::value_to<std::vector<Self::Interface>>(object.at("interfaces"));
    return self;
}

}  // namespace nmk::nmos
