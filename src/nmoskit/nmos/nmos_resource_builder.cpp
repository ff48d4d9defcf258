/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/nmos_resource_builder.hpp"

nmk::nmos::SelfBuilder::SelfBuilder(std::string href) {
    resource_.href = std::move(href);
}

nmk::nmos::SelfBuilder& nmk::nmos::SelfBuilder::hostname(std::string hostname) {
    resource_.hostname = std::move(hostname);
    return *this;
}

nmk::nmos::SelfBuilder&
nmk::nmos::SelfBuilder::api_endpoint(std::string host, const uint16_t port, std::string protocol) {
    resource_.api.endpoints.push_back({std::move(host), port, std::move(protocol)});
    return *this;
}

nmk::nmos::SelfBuilder& nmk::nmos::SelfBuilder::api_version(const ApiVersion& version) {
    resource_.api.versions.push_back(version.to_string());
    return *this;
}

nmk::nmos::SelfBuilder& nmk::nmos::SelfBuilder::network_interface(Self::Interface network_interface) {
    resource_.interfaces.push_back(std::move(network_interface));
    return *this;
}

nmk::nmos::DeviceBuilder::DeviceBuilder(const Self& node, std::string type) {
    resource_.node_id = node.id;
    resource_.type = std::move(type);
}

nmk::nmos::DeviceBuilder& nmk::nmos::DeviceBuilder::control(std::string href, std::string type) {
    resource_.controls.push_back({std::move(href), std::move(type), false});
    return *this;
}

nmk::nmos::SenderBuilder::SenderBuilder(const Device& device, const Transport transport) {
    resource_.device_id = device.id;
    resource_.transport = transport;
}

nmk::nmos::SenderBuilder& nmk::nmos::SenderBuilder::flow_id(const boost::uuids::uuid& flow_id) {
    resource_.flow_id = flow_id;
    return *this;
}

nmk::nmos::SenderBuilder& nmk::nmos::SenderBuilder::manifest_href(std::string manifest_href) {
    resource_.manifest_href = std::move(manifest_href);
    return *this;
}

nmk::nmos::SenderBuilder& nmk::nmos::SenderBuilder::interface_binding(std::string interface_name) {
    resource_.interface_bindings.push_back(std::move(interface_name));
    return *this;
}

nmk::nmos::ReceiverBuilder::ReceiverBuilder(const Device& device, const Format format, const Transport transport) {
    resource_.device_id = device.id;
    resource_.format = format;
    resource_.transport = transport;
}

nmk::nmos::ReceiverBuilder& nmk::nmos::ReceiverBuilder::media_type(std::string media_type) {
    resource_.caps.media_types.push_back(std::move(media_type));
    return *this;
}

nmk::nmos::ReceiverBuilder& nmk::nmos::ReceiverBuilder::interface_binding(std::string interface_name) {
    resource_.interface_bindings.push_back(std::move(interface_name));
    return *this;
}
