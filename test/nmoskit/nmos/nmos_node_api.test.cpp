/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/nmos_node_api.hpp"
#include "nmoskit/nmos/nmos_resource_builder.hpp"

#include <boost/json/parse.hpp>
#include <catch2/catch_all.hpp>

namespace {

nmk::HttpServer::Response get(const nmk::HttpServer& server, const std::string_view target) {
    nmk::HttpServer::Request request {boost::beast::http::verb::get, target, 11};
    return server.handle_request(request);
}

boost::json::value get_json(const nmk::HttpServer& server, const std::string_view target) {
    const auto response = get(server, target);
    REQUIRE(response.result() == boost::beast::http::status::ok);
    REQUIRE(response[boost::beast::http::field::content_type] == "application/json");
    return boost::json::parse(response.body());
}

}  // namespace

TEST_CASE("nmk::nmos::NodeApi") {
    boost::asio::io_context io_context;
    nmk::HttpServer server(io_context);
    auto model = std::make_shared<nmk::nmos::Model>();
    nmk::nmos::NodeApi node_api(server, model);

    SECTION("Base paths") {
        REQUIRE(get_json(server, "/") == boost::json::array({"x-nmos/"}));
        REQUIRE(get_json(server, "/x-nmos") == boost::json::array({"node/"}));
        REQUIRE(get_json(server, "/x-nmos/") == boost::json::array({"node/"}));
        REQUIRE(get_json(server, "/x-nmos/node") == boost::json::array({"v1.2/", "v1.3/"}));

        const auto collections = get_json(server, "/x-nmos/node/v1.3");
        REQUIRE(collections.as_array().size() == 6);
        REQUIRE(collections.as_array().at(0).as_string() == "self/");
    }

    SECTION("Invalid API version") {
        for (const auto* target : {"/x-nmos/node/v1.1", "/x-nmos/node/v1.1/self", "/x-nmos/node/latest/devices"}) {
            const auto response = get(server, target);
            REQUIRE(response.result() == boost::beast::http::status::bad_request);
            const auto body = boost::json::parse(response.body());
            REQUIRE(body.as_object().at("code").to_number<int>() == 400);
            REQUIRE(body.as_object().at("error").as_string() == "Invalid API version");
        }
    }

    SECTION("Self is not found before the node is initialized") {
        const auto response = get(server, "/x-nmos/node/v1.3/self");
        REQUIRE(response.result() == boost::beast::http::status::not_found);
    }

    SECTION("Empty collections") {
        REQUIRE(get_json(server, "/x-nmos/node/v1.3/devices").as_array().empty());
        REQUIRE(get_json(server, "/x-nmos/node/v1.3/senders").as_array().empty());
        REQUIRE(get_json(server, "/x-nmos/node/v1.3/receivers").as_array().empty());
        REQUIRE(get_json(server, "/x-nmos/node/v1.2/sources").as_array().empty());
        REQUIRE(get_json(server, "/x-nmos/node/v1.2/flows").as_array().empty());
    }

    SECTION("Populated model") {
        const auto self = nmk::nmos::SelfBuilder("http://127.0.0.1:8000/").label("Node").build();
        const auto device = nmk::nmos::DeviceBuilder(self, nmk::nmos::Device::k_type_generic).label("Device").build();
        const auto sender = nmk::nmos::SenderBuilder(device, nmk::nmos::Transport::rtp_multicast).build();
        const auto receiver = nmk::nmos::ReceiverBuilder(device, nmk::nmos::Format::audio, nmk::nmos::Transport::rtp)
                                  .build();
        REQUIRE(model->insert(self));
        REQUIRE(model->insert(device));
        REQUIRE(model->insert(sender));
        REQUIRE(model->insert(receiver));

        SECTION("Self") {
            const auto json = get_json(server, "/x-nmos/node/v1.3/self");
            REQUIRE(json.as_object().at("id").as_string() == boost::uuids::to_string(self.id));
            REQUIRE(json.as_object().at("label").as_string() == "Node");
        }

        SECTION("Devices") {
            const auto json = get_json(server, "/x-nmos/node/v1.3/devices");
            REQUIRE(json.as_array().size() == 1);
            const auto& device_json = json.as_array().at(0).as_object();
            REQUIRE(device_json.at("id").as_string() == boost::uuids::to_string(device.id));
            REQUIRE(device_json.at("senders").as_array().at(0).as_string() == boost::uuids::to_string(sender.id));
            REQUIRE(device_json.at("receivers").as_array().at(0).as_string() == boost::uuids::to_string(receiver.id));
        }

        SECTION("Single resources") {
            const auto device_id = boost::uuids::to_string(device.id);
            const auto device_json = get_json(server, "/x-nmos/node/v1.3/devices/" + device_id);
            REQUIRE(boost::json::value_to<nmk::nmos::Device>(device_json).id == device.id);

            const auto sender_id = boost::uuids::to_string(sender.id);
            const auto sender_json = get_json(server, "/x-nmos/node/v1.2/senders/" + sender_id);
            REQUIRE(boost::json::value_to<nmk::nmos::Sender>(sender_json).device_id == device.id);

            const auto receiver_json =
                get_json(server, "/x-nmos/node/v1.3/receivers/" + boost::uuids::to_string(receiver.id) + "/");
            REQUIRE(boost::json::value_to<nmk::nmos::Receiver>(receiver_json).id == receiver.id);
        }

        SECTION("Invalid id") {
            const auto response = get(server, "/x-nmos/node/v1.3/senders/not-a-uuid");
            REQUIRE(response.result() == boost::beast::http::status::bad_request);
            const auto body = boost::json::parse(response.body());
            REQUIRE(body.as_object().at("error").as_string() == "Invalid Sender ID");
        }

        SECTION("Unknown id") {
            const auto target = "/x-nmos/node/v1.3/receivers/" + boost::uuids::to_string(nmk::nmos::generate_uuid());
            const auto response = get(server, target);
            REQUIRE(response.result() == boost::beast::http::status::not_found);
            const auto body = boost::json::parse(response.body());
            REQUIRE(body.as_object().at("code").to_number<int>() == 404);
            REQUIRE(body.as_object().at("error").as_string() == "Receiver not found");
        }

        SECTION("Removed resources disappear") {
            REQUIRE(model->remove<nmk::nmos::Sender>(sender.id));
            REQUIRE(get_json(server, "/x-nmos/node/v1.3/senders").as_array().empty());
            const auto response = get(server, "/x-nmos/node/v1.3/senders/" + boost::uuids::to_string(sender.id));
            REQUIRE(response.result() == boost::beast::http::status::not_found);
        }
    }

    SECTION("CORS headers") {
        const auto response = get(server, "/x-nmos/node");
        REQUIRE(response[boost::beast::http::field::access_control_allow_origin] == "*");
        REQUIRE(response[boost::beast::http::field::access_control_allow_methods] == "GET");
    }

    SECTION("Only GET is routed") {
        nmk::HttpServer::Request request {boost::beast::http::verb::options, "/x-nmos/node", 11};
        REQUIRE(server.handle_request(request).result() != boost::beast::http::status::ok);
    }

    SECTION("Unknown path") {
        REQUIRE(get(server, "/x-nmos/query/v1.3").result() == boost::beast::http::status::not_found);
    }
}

TEST_CASE("nmk::nmos::NodeApi routes keep the model alive") {
    boost::asio::io_context io_context;
    nmk::HttpServer server(io_context);

    const auto self = nmk::nmos::SelfBuilder("http://127.0.0.1:8000/").label("Node").build();
    const auto device = nmk::nmos::DeviceBuilder(self, nmk::nmos::Device::k_type_generic).label("Device").build();

    {
        auto model = std::make_shared<nmk::nmos::Model>();
        REQUIRE(model->insert(self));
        REQUIRE(model->insert(device));
        nmk::nmos::NodeApi node_api(server, model);
    }

    const auto self_json = get_json(server, "/x-nmos/node/v1.3/self");
    REQUIRE(self_json.as_object().at("label").as_string() == "Node");

    const auto devices = get_json(server, "/x-nmos/node/v1.3/devices");
    REQUIRE(devices.as_array().size() == 1);
    REQUIRE(devices.as_array().at(0).as_object().at("label").as_string() == "Device");
}
