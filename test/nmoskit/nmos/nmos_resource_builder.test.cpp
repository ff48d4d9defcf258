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

#include <catch2/catch_all.hpp>

#include <set>

namespace {

class FixedTimeSource final: public nmk::nmos::TimeSource {
  public:
    nmk::nmos::Version now() override {
        return {1439299836, 10};
    }
};

}  // namespace

TEST_CASE("nmk::nmos::ResourceBuilder") {
    FixedTimeSource time_source;

    const auto self = nmk::nmos::SelfBuilder("http://192.168.1.10:8000/")
                          .label("Node")
                          .description("Studio node")
                          .tag("location", "studio 1")
                          .tag("location", "rack 2")
                          .hostname("studio-node")
                          .api_endpoint("192.168.1.10", 8000)
                          .api_version(nmk::nmos::ApiVersion::v1_3())
                          .network_interface({std::nullopt, "00-1a-2b-3c-4d-5e", "eth0"})
                          .build(time_source);

    SECTION("Self") {
        REQUIRE_FALSE(self.id.is_nil());
        REQUIRE(self.version.to_string() == "1439299836:10");
        REQUIRE(self.label == "Node");
        REQUIRE(self.description == "Studio node");
        REQUIRE(self.tags.at("location") == std::vector<std::string> {"studio 1", "rack 2"});
        REQUIRE(self.href == "http://192.168.1.10:8000/");
        REQUIRE(self.hostname == "studio-node");
        REQUIRE(self.api.endpoints.size() == 1);
        REQUIRE(self.api.endpoints[0].protocol == "http");
        REQUIRE(self.api.versions == std::vector<std::string> {"v1.3"});
        REQUIRE(self.interfaces.size() == 1);
    }

    SECTION("Device, sender and receiver reference their parent") {
        const auto connection_href = "http://192.168.1.10:8000/x-nmos/connection/v1.1";
        const auto device = nmk::nmos::DeviceBuilder(self, nmk::nmos::Device::k_type_pipeline)
                                .control(connection_href, "urn:x-nmos:control:sr-ctrl/v1.1")
                                .build(time_source);
        REQUIRE(device.node_id == self.id);
        REQUIRE(device.type == "urn:x-nmos:device:pipeline");
        REQUIRE(device.controls.size() == 1);
        REQUIRE(device.senders.empty());
        REQUIRE(device.receivers.empty());

        const auto flow_id = nmk::nmos::generate_uuid();
        const auto sender = nmk::nmos::SenderBuilder(device, nmk::nmos::Transport::rtp_unicast)
                                .flow_id(flow_id)
                                .manifest_href("http://192.168.1.10:8000/sdp/1.sdp")
                                .interface_binding("eth0")
                                .build(time_source);
        REQUIRE(sender.device_id == device.id);
        REQUIRE(sender.transport == nmk::nmos::Transport::rtp_unicast);
        REQUIRE(sender.flow_id == flow_id);
        REQUIRE(sender.manifest_href == "http://192.168.1.10:8000/sdp/1.sdp");
        REQUIRE(sender.interface_bindings == std::vector<std::string> {"eth0"});

        const auto receiver = nmk::nmos::ReceiverBuilder(device, nmk::nmos::Format::audio, nmk::nmos::Transport::rtp)
                                  .media_type("audio/L24")
                                  .build(time_source);
        REQUIRE(receiver.device_id == device.id);
        REQUIRE(receiver.caps.media_types == std::vector<std::string> {"audio/L24"});
        REQUIRE_FALSE(receiver.subscription.sender_id.has_value());
    }

    SECTION("Every build gets a unique id") {
        nmk::nmos::DeviceBuilder builder(self, nmk::nmos::Device::k_type_generic);
        std::set<boost::uuids::uuid> ids;
        for (int i = 0; i < 100; ++i) {
            ids.insert(builder.build().id);
        }
        REQUIRE(ids.size() == 100);
    }

    SECTION("Default time source produces a valid version") {
        REQUIRE(nmk::nmos::SenderBuilder(nmk::nmos::Device {}, nmk::nmos::Transport::rtp).build().version.is_valid());
    }
}
