/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/models/nmos_sender.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::nmos::Sender") {
    nmk::nmos::Sender sender;
    sender.id = nmk::nmos::generate_uuid();
    sender.version = {5, 5};
    sender.label = "Sender 1";
    sender.device_id = nmk::nmos::generate_uuid();
    sender.interface_bindings = {"eth0"};

    SECTION("To json with absent optionals") {
        const auto json = boost::json::value_from(sender);
        const auto& object = json.as_object();
        REQUIRE(object.at("flow_id").is_null());
        REQUIRE(object.at("manifest_href").is_null());
        REQUIRE(object.at("transport").as_string() == "urn:x-nmos:transport:rtp.mcast");
        REQUIRE(object.at("device_id").as_string() == boost::uuids::to_string(sender.device_id));
        REQUIRE(object.at("interface_bindings").as_array().at(0).as_string() == "eth0");
        REQUIRE(object.at("subscription").as_object().at("receiver_id").is_null());
        REQUIRE(object.at("subscription").as_object().at("active").as_bool() == false);
    }

    SECTION("To json and back") {
        sender.flow_id = nmk::nmos::generate_uuid();
        sender.manifest_href = "http://192.168.1.10:8000/sdp/sender1.sdp";
        sender.transport = nmk::nmos::Transport::rtp_unicast;
        sender.subscription.receiver_id = nmk::nmos::generate_uuid();
        sender.subscription.active = true;

        const auto parsed = boost::json::value_to<nmk::nmos::Sender>(boost::json::value_from(sender));
        REQUIRE(parsed.id == sender.id);
        REQUIRE(parsed.flow_id == sender.flow_id);
        REQUIRE(parsed.manifest_href == sender.manifest_href);
        REQUIRE(parsed.transport == nmk::nmos::Transport::rtp_unicast);
        REQUIRE(parsed.device_id == sender.device_id);
        REQUIRE(parsed.interface_bindings == sender.interface_bindings);
        REQUIRE(parsed.subscription.receiver_id == sender.subscription.receiver_id);
        REQUIRE(parsed.subscription.active);
    }

    SECTION("Unknown transport") {
        auto json = boost::json::value_from(sender);
        json.as_object()["transport"] = "urn:x-nmos:transport:carrier-pigeon";
        REQUIRE_THROWS_AS(boost::json::value_to<nmk::nmos::Sender>(json), std::invalid_argument);
    }
}
