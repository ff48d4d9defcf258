/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/nmos_node.hpp"

#include "nmoskit/core/log.hpp"
#include "nmoskit/core/scoped_rollback.hpp"
#include "nmoskit/nmos/nmos_resource_builder.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include <tuple>

namespace {

void read_string(const boost::json::object& object, const char* key, std::string& value) {
    if (const auto* item = object.if_contains(key)) {
        value = item->as_string();
    }
}

boost::json::object to_json(const nmk::nmos::Node::DeviceConfiguration& device) {
    boost::json::array senders;
    for (const auto& sender : device.senders) {
        senders.push_back(
            boost::json::object {
                {"label", sender.label},
                {"description", sender.description},
                {"transport", nmk::nmos::to_urn(sender.transport)},
            }
        );
    }

    boost::json::array receivers;
    for (const auto& receiver : device.receivers) {
        receivers.push_back(
            boost::json::object {
                {"label", receiver.label},
                {"description", receiver.description},
                {"format", nmk::nmos::to_urn(receiver.format)},
                {"transport", nmk::nmos::to_urn(receiver.transport)},
            }
        );
    }

    return {
        {"label", device.label},
        {"description", device.description},
        {"type", device.type},
        {"senders", std::move(senders)},
        {"receivers", std::move(receivers)},
    };
}

boost::system::result<nmk::nmos::Transport, std::string> transport_from_json(const boost::json::object& object) {
    const auto* item = object.if_contains("transport");
    if (item == nullptr) {
        return nmk::nmos::Transport::rtp_multicast;
    }
    const auto transport = nmk::nmos::transport_from_urn(item->as_string());
    if (!transport) {
        return fmt::format("Invalid transport: {}", std::string_view(item->as_string()));
    }
    return *transport;
}

}  // namespace

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Node::Configuration::validate() const {
    boost::system::error_code ec;
    std::ignore = boost::asio::ip::make_address(api_address, ec);
    if (ec) {
        NMK_ERROR("Invalid API address: {}", api_address);
        return Error::invalid_configuration;
    }

    for (const auto& device : devices) {
        if (device.type.empty()) {
            NMK_ERROR("Device '{}' has no type", device.label);
            return Error::invalid_configuration;
        }
    }

    return {};
}

boost::json::value nmk::nmos::Node::Configuration::to_json() const {
    boost::json::array devices_json;
    for (const auto& device : devices) {
        devices_json.push_back(::to_json(device));
    }

    return {
        {"label", label},
        {"description", description},
        {"hostname", hostname},
        {"api_address", api_address},
        {"api_port", api_port},
        {"devices", std::move(devices_json)},
    };
}

boost::system::result<nmk::nmos::Node::Configuration, std::string>
nmk::nmos::Node::Configuration::from_json(const boost::json::value& json) {
    try {
        const auto& object = json.as_object();
        Configuration config {};

        read_string(object, "label", config.label);
        read_string(object, "description", config.description);
        read_string(object, "hostname", config.hostname);
        read_string(object, "api_address", config.api_address);
        if (const auto* api_port = object.if_contains("api_port")) {
            config.api_port = api_port->to_number<uint16_t>();
        }

        if (const auto* devices = object.if_contains("devices")) {
            for (const auto& device_json : devices->as_array()) {
                const auto& device_object = device_json.as_object();
                DeviceConfiguration device;
                read_string(device_object, "label", device.label);
                read_string(device_object, "description", device.description);
                read_string(device_object, "type", device.type);

                if (const auto* senders = device_object.if_contains("senders")) {
                    for (const auto& sender_json : senders->as_array()) {
                        const auto& sender_object = sender_json.as_object();
                        SenderConfiguration sender;
                        read_string(sender_object, "label", sender.label);
                        read_string(sender_object, "description", sender.description);
                        auto transport = transport_from_json(sender_object);
                        if (!transport) {
                            return transport.error();
                        }
                        sender.transport = *transport;
                        device.senders.push_back(std::move(sender));
                    }
                }

                if (const auto* receivers = device_object.if_contains("receivers")) {
                    for (const auto& receiver_json : receivers->as_array()) {
                        const auto& receiver_object = receiver_json.as_object();
                        ReceiverConfiguration receiver;
                        read_string(receiver_object, "label", receiver.label);
                        read_string(receiver_object, "description", receiver.description);
                        if (const auto* format_json = receiver_object.if_contains("format")) {
                            const auto format = format_from_urn(format_json->as_string());
                            if (!format) {
                                return fmt::format("Invalid format: {}", std::string_view(format_json->as_string()));
                            }
                            receiver.format = *format;
                        }
                        auto transport = transport_from_json(receiver_object);
                        if (!transport) {
                            return transport.error();
                        }
                        receiver.transport = *transport;
                        device.receivers.push_back(std::move(receiver));
                    }
                }

                config.devices.push_back(std::move(device));
            }
        }

        return config;
    } catch (const std::exception& e) {
        return e.what();
    }
}

nmk::nmos::Node::Node(boost::asio::io_context& io_context, std::unique_ptr<RegistryBrowserBase> registry_browser) :
    model_(std::make_shared<Model>()),
    http_server_(io_context),
    node_api_(http_server_, model_),
    registry_browser_(std::move(registry_browser)) {
    if (!registry_browser_) {
        registry_browser_ = std::make_unique<RegistryBrowser>(io_context);
    }

    registry_browser_->on_candidate_resolved = [this](const RegistryCandidate& candidate) {
        if (!started_) {
            return;
        }
        registry_selector_.handle_resolved(candidate);
    };

    registry_browser_->on_candidate_rejected = [this](const std::string& service_name) {
        if (!started_) {
            return;
        }
        if (registry_selector_.handle_removed(service_name)) {
            NMK_WARNING("Registry {} dropped, its advertisement is no longer valid", service_name);
        }
    };

    registry_browser_->on_candidate_removed = [this](const std::string& service_name) {
        if (!started_) {
            return;
        }
        if (!registry_selector_.handle_removed(service_name)) {
            NMK_TRACE("Ignoring removal of unknown registry {}", service_name);
        }
    };

    registry_browser_->on_error = [](const std::string& error_message) {
        NMK_DEBUG("Registry discovery continues after error: {}", error_message);
    };

    registry_selector_.on_active_changed = [this](const std::optional<RegistryCandidate>& registry) {
        subscribers_.foreach ([&registry](Subscriber* subscriber) {
            subscriber->nmos_registry_changed(registry);
        });
    };
}

nmk::nmos::Node::~Node() {
    stop();
}

boost::system::result<void, nmk::nmos::Error> nmk::nmos::Node::start(const Configuration& configuration) {
    if (started_) {
        return Error::already_started;
    }

    if (auto result = configuration.validate(); !result) {
        return result.error();
    }

    if (self_id_) {
        // Resources of a previous run
        if (!model_->remove<Self>(*self_id_, Model::RemoveMode::cascade)) {
            NMK_WARNING("Failed to remove the resources of the previous run");
        }
        self_id_.reset();
    }

    if (auto result = http_server_.start(configuration.api_address, configuration.api_port); !result) {
        NMK_ERROR("Failed to start the Node API: {}", result.error().message());
        return Error::failed_to_start_http_server;
    }

    ScopedRollback rollback([this] {
        http_server_.stop();
    });

    const auto endpoint = http_server_.get_local_endpoint();
    auto host = configuration.hostname;
    if (host.empty() && !endpoint.address().is_unspecified()) {
        host = endpoint.address().to_string();
    }
    if (host.empty()) {
        boost::system::error_code ec;
        host = boost::asio::ip::host_name(ec);
        if (ec) {
            NMK_WARNING("Failed to get the host name: {}", ec.message());
            host = "localhost";
        }
    }

    if (auto result = populate_model(configuration, host, endpoint.port()); !result) {
        return result.error();
    }

    rollback.commit();
    configuration_ = configuration;
    started_ = true;

    registry_browser_->start({NodeApi::k_api_versions.begin(), NodeApi::k_api_versions.end()});

    NMK_INFO("NMOS node started, Node API at http://{}:{}/x-nmos/node", host, endpoint.port());
    return {};
}

void nmk::nmos::Node::stop() {
    if (!started_) {
        return;
    }
    started_ = false;

    registry_browser_->stop();
    http_server_.stop();
    registry_selector_.clear();

    NMK_INFO("NMOS node stopped");
}

bool nmk::nmos::Node::is_started() const {
    return started_;
}

bool nmk::nmos::Node::subscribe(Subscriber* subscriber) {
    if (!subscribers_.add(subscriber)) {
        return false;
    }
    subscriber->nmos_registry_changed(registry_selector_.get_active());
    return true;
}

bool nmk::nmos::Node::unsubscribe(const Subscriber* subscriber) {
    return subscribers_.remove(subscriber);
}

std::shared_ptr<nmk::nmos::Model> nmk::nmos::Node::get_model() const {
    return model_;
}

const std::optional<nmk::nmos::RegistryCandidate>& nmk::nmos::Node::get_active_registry() const {
    return registry_selector_.get_active();
}

std::vector<nmk::nmos::RegistryCandidate> nmk::nmos::Node::get_registry_candidates() const {
    return registry_selector_.get_candidates();
}

const nmk::nmos::Node::Configuration& nmk::nmos::Node::get_configuration() const {
    return configuration_;
}

boost::asio::ip::tcp::endpoint nmk::nmos::Node::get_local_endpoint() const {
    return http_server_.get_local_endpoint();
}

boost::system::result<void, nmk::nmos::Error>
nmk::nmos::Node::populate_model(
    const Configuration& configuration, const std::string& host, const uint16_t port
) {
    // Build everything before touching the model
    SelfBuilder self_builder(fmt::format("http://{}:{}/", host, port));
    self_builder.label(configuration.label)
        .description(configuration.description)
        .hostname(configuration.hostname.empty() ? host : configuration.hostname)
        .api_endpoint(host, port);
    for (const auto& version : NodeApi::k_api_versions) {
        self_builder.api_version(version);
    }
    const auto self = self_builder.build();

    std::vector<Device> devices;
    std::vector<Sender> senders;
    std::vector<Receiver> receivers;

    for (const auto& device_config : configuration.devices) {
        auto device = DeviceBuilder(self, device_config.type)
                          .label(device_config.label)
                          .description(device_config.description)
                          .build();

        for (const auto& sender_config : device_config.senders) {
            senders.push_back(SenderBuilder(device, sender_config.transport)
                                  .label(sender_config.label)
                                  .description(sender_config.description)
                                  .build());
        }

        for (const auto& receiver_config : device_config.receivers) {
            receivers.push_back(ReceiverBuilder(device, receiver_config.format, receiver_config.transport)
                                    .label(receiver_config.label)
                                    .description(receiver_config.description)
                                    .build());
        }

        devices.push_back(std::move(device));
    }

    if (auto result = model_->insert(self); !result) {
        NMK_ERROR("Failed to insert node: {}", result.error());
        return result.error();
    }

    ScopedRollback rollback([this, id = self.id] {
        if (!model_->remove<Self>(id, Model::RemoveMode::cascade)) {
            NMK_ERROR("Failed to roll back node {}", boost::uuids::to_string(id));
        }
    });

    for (const auto& device : devices) {
        if (auto result = model_->insert(device); !result) {
            NMK_ERROR("Failed to insert device {}: {}", device.label, result.error());
            return result.error();
        }
    }

    for (const auto& sender : senders) {
        if (auto result = model_->insert(sender); !result) {
            NMK_ERROR("Failed to insert sender {}: {}", sender.label, result.error());
            return result.error();
        }
    }

    for (const auto& receiver : receivers) {
        if (auto result = model_->insert(receiver); !result) {
            NMK_ERROR("Failed to insert receiver {}: {}", receiver.label, result.error());
            return result.error();
        }
    }

    rollback.commit();
    self_id_ = self.id;

    NMK_INFO(
        "Node {} has {} devices, {} senders and {} receivers", boost::uuids::to_string(self.id), devices.size(),
        senders.size(), receivers.size()
    );
    return {};
}
