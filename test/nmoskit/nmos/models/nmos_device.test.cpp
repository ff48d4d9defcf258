/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/models/nmos_device.hpp"

#include <boost/json/parse.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("nmk::nmos::Device") {
    nmk::nmos::Device device;
    device.id = nmk::nmos::generate_uuid();
    device.version = {1439299836, 10};
    device.label = "Device 1";
    device.description = "Playout device";
    device.tags["location"] = {"studio 1"};
    device.type = nmk::nmos::Device::k_type_pipeline;
    device.node_id = nmk::nmos::generate_uuid();
    device.senders = {nmk::nmos::generate_uuid(), nmk::nmos::generate_uuid()};
    device.receivers = {nmk::nmos::generate_uuid()};
    device.controls.push_back({"http://192.168.1.10:8080/x-nmos/connection/v1.1", "urn:x-nmos:control:sr-ctrl/v1.1"});

    SECTION("To json") {
        const auto json = boost::json::value_from(device);
        const auto& object = json.as_object();
        REQUIRE(object.at("id").as_string() == boost::uuids::to_string(device.id));
        REQUIRE(object.at("version").as_string() == "1439299836:10");
        REQUIRE(object.at("label").as_string() == "Device 1");
        REQUIRE(object.at("description").as_string() == "Playout device");
        REQUIRE(object.at("tags").as_object().at("location").as_array().size() == 1);
        REQUIRE(object.at("type").as_string() == "urn:x-nmos:device:pipeline");
        REQUIRE(object.at("node_id").as_string() == boost::uuids::to_string(device.node_id));
        REQUIRE(object.at("senders").as_array().size() == 2);
        REQUIRE(object.at("senders").as_array().at(0).as_string() == boost::uuids::to_string(device.senders[0]));
        REQUIRE(object.at("receivers").as_array().size() == 1);
        const auto& control = object.at("controls").as_array().at(0).as_object();
        REQUIRE(control.at("type").as_string() == "urn:x-nmos:control:sr-ctrl/v1.1");
        REQUIRE(control.at("authorization").as_bool() == false);
    }

    SECTION("To json and back") {
        const auto parsed = boost::json::value_to<nmk::nmos::Device>(boost::json::value_from(device));
        REQUIRE(parsed.id == device.id);
        REQUIRE(parsed.version.to_string() == "1439299836:10");
        REQUIRE(parsed.label == device.label);
        REQUIRE(parsed.tags == device.tags);
        REQUIRE(parsed.type == device.type);
        REQUIRE(parsed.node_id == device.node_id);
        REQUIRE(parsed.senders == device.senders);
        REQUIRE(parsed.receivers == device.receivers);
        REQUIRE(parsed.controls.size() == 1);
        REQUIRE(parsed.controls[0].href == device.controls[0].href);
    }

    SECTION("From json with invalid attributes") {
        auto json = boost::json::value_from(device);

        SECTION("Invalid id") {
            json.as_object()["id"] = "not-a-uuid";
        }

        SECTION("Invalid version") {
            json.as_object()["version"] = "1439299836";
        }

        SECTION("Missing node_id") {
            json.as_object().erase("node_id");
        }

        SECTION("Senders is not an array") {
            json.as_object()["senders"] = "none";
        }

        REQUIRE_THROWS(boost::json::value_to<nmk::nmos::Device>(json));
    }
}
