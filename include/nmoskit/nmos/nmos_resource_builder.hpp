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

#include "detail/nmos_api_version.hpp"
#include "detail/nmos_media_types.hpp"
#include "detail/nmos_time_source.hpp"
#include "detail/nmos_uuid.hpp"
#include "models/nmos_device.hpp"
#include "models/nmos_receiver.hpp"
#include "models/nmos_self.hpp"
#include "models/nmos_sender.hpp"

#include <string>

namespace nmk::nmos {

/**
 * Holds the attributes all builders have in common. Identity and version are only assigned by build().
 * @tparam Derived The concrete builder.
 * @tparam T The resource type.
 */
template<class Derived, class T>
class ResourceBuilder {
  public:
    /**
     * @param label Freeform string label for the resource.
     */
    Derived& label(std::string label) {
        resource_.label = std::move(label);
        return static_cast<Derived&>(*this);
    }

    /**
     * @param description Detailed description of the resource.
     */
    Derived& description(std::string description) {
        resource_.description = std::move(description);
        return static_cast<Derived&>(*this);
    }

    /**
     * Adds a value to a tag.
     * @param key The name of the tag.
     * @param value The value to add.
     */
    Derived& tag(const std::string& key, std::string value) {
        resource_.tags[key].push_back(std::move(value));
        return static_cast<Derived&>(*this);
    }

    /**
     * Produces the resource with a freshly generated id and a version stamped from the time source. Doesn't touch the
     * Model, the resource must be inserted by the caller. Every call produces a resource with a different id.
     * @param time_source The source of the initial version.
     * @return The resource.
     */
    [[nodiscard]] T build(TimeSource& time_source = TaiClock::instance()) const {
        T resource = resource_;
        resource.id = generate_uuid();
        resource.version = time_source.now();
        return resource;
    }

  protected:
    T resource_;

    ResourceBuilder() = default;
};

/**
 * Builds the Node resource.
 */
class SelfBuilder: public ResourceBuilder<SelfBuilder, Self> {
  public:
    /**
     * @param href HTTP access href for the Node's API.
     */
    explicit SelfBuilder(std::string href);

    SelfBuilder& hostname(std::string hostname);

    /**
     * Adds an endpoint the Node API can be reached at.
     */
    SelfBuilder& api_endpoint(std::string host, uint16_t port, std::string protocol = "http");

    /**
     * Adds a supported API version.
     */
    SelfBuilder& api_version(const ApiVersion& version);

    SelfBuilder& network_interface(Self::Interface network_interface);
};

/**
 * Builds a Device of a Node.
 */
class DeviceBuilder: public ResourceBuilder<DeviceBuilder, Device> {
  public:
    /**
     * @param node The Node the Device belongs to.
     * @param type The Device type URN (i.e. Device::k_type_generic).
     */
    DeviceBuilder(const Self& node, std::string type);

    /**
     * Adds a control endpoint.
     */
    DeviceBuilder& control(std::string href, std::string type);
};

/**
 * Builds a Sender of a Device.
 */
class SenderBuilder: public ResourceBuilder<SenderBuilder, Sender> {
  public:
    /**
     * @param device The Device the Sender belongs to.
     * @param transport The transport used by the Sender.
     */
    SenderBuilder(const Device& device, Transport transport);

    SenderBuilder& flow_id(const boost::uuids::uuid& flow_id);
    SenderBuilder& manifest_href(std::string manifest_href);
    SenderBuilder& interface_binding(std::string interface_name);
};

/**
 * Builds a Receiver of a Device.
 */
class ReceiverBuilder: public ResourceBuilder<ReceiverBuilder, Receiver> {
  public:
    /**
     * @param device The Device the Receiver belongs to.
     * @param format The format of the essence the Receiver accepts.
     * @param transport The transport used by the Receiver.
     */
    ReceiverBuilder(const Device& device, Format format, Transport transport);

    /**
     * Adds an accepted media type, i.e. "audio/L24".
     */
    ReceiverBuilder& media_type(std::string media_type);
    ReceiverBuilder& interface_binding(std::string interface_name);
};

}  // namespace nmk::nmos
