/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/log.hpp"
#include "nmoskit/nmos/nmos_node.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json/parse.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <tuple>

namespace {

/**
 * Logs the registry the node should register with.
 */
class RegistryLogger: public nmk::nmos::Node::Subscriber {
  public:
    void nmos_registry_changed(const std::optional<nmk::nmos::RegistryCandidate>& registry) override {
        if (registry) {
            NMK_INFO("Registering with {} ({})", registry->registration_api_url(), registry->service_name);
        } else {
            NMK_INFO("No registry available");
        }
    }
};

nmk::nmos::Node::Configuration default_configuration() {
    nmk::nmos::Node::Configuration config;
    config.label = "nmoskit node";
    config.description = "nmoskit example node";
    config.api_port = 8000;

    for (int i = 0; i < 2; ++i) {
        nmk::nmos::Node::DeviceConfiguration device;
        device.label = fmt::format("nmoskit/device/{}", i);
        device.description = fmt::format("nmoskit device {}", i + 1);
        device.senders.push_back(
            {fmt::format("nmoskit/device/{}/sender/0", i), "Audio sender", nmk::nmos::Transport::rtp_multicast}
        );
        device.receivers.push_back(
            {fmt::format("nmoskit/device/{}/receiver/0", i), "Audio receiver", nmk::nmos::Format::audio,
             nmk::nmos::Transport::rtp_multicast}
        );
        config.devices.push_back(std::move(device));
    }

    return config;
}

}  // namespace

int main(const int argc, char* argv[]) {
    nmk::set_log_level_from_env();

    auto config = default_configuration();

    if (argc > 1) {
        std::ifstream file(argv[1]);
        if (!file) {
            std::cerr << "Failed to open " << argv[1] << std::endl;
            return 1;
        }
        std::stringstream content;
        content << file.rdbuf();

        boost::system::error_code ec;
        const auto json = boost::json::parse(content.str(), ec);
        if (ec) {
            std::cerr << "Failed to parse " << argv[1] << ": " << ec.message() << std::endl;
            return 1;
        }

        auto parsed = nmk::nmos::Node::Configuration::from_json(json);
        if (!parsed) {
            std::cerr << "Invalid configuration: " << parsed.error() << std::endl;
            return 1;
        }
        config = std::move(*parsed);
    }

    boost::asio::io_context io_context;

    nmk::nmos::Node node(io_context);
    RegistryLogger registry_logger;
    std::ignore = node.subscribe(&registry_logger);

    if (auto result = node.start(config); !result) {
        NMK_ERROR("Failed to start NMOS node: {}", result.error());
        std::ignore = node.unsubscribe(&registry_logger);
        return 1;
    }

    const auto endpoint = node.get_local_endpoint();
    NMK_INFO("Node API: http://{}:{}/x-nmos/node/v1.3/", endpoint.address().to_string(), endpoint.port());

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        NMK_INFO("Stopping NMOS node...");
        node.stop();
        io_context.stop();
    });

    io_context.run();

    std::ignore = node.unsubscribe(&registry_logger);
    return 0;
}
