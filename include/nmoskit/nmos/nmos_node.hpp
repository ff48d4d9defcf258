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

#include "nmos_model.hpp"
#include "nmos_node_api.hpp"
#include "detail/nmos_error.hpp"
#include "detail/nmos_media_types.hpp"
#include "detail/nmos_registry_browser.hpp"
#include "detail/nmos_registry_candidate.hpp"
#include "detail/nmos_registry_selector.hpp"
#include "nmoskit/core/net/http/http_server.hpp"
#include "nmoskit/core/util/subscriber_list.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/json/value.hpp>
#include <boost/system/result.hpp>
#include <boost/uuid/uuid.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nmk::nmos {

/**
 * Implements the node side of NMOS IS-04: owns the resource model and serves it through the Node API, and discovers
 * the registries on the network and selects the one to register with.
 * https://specs.amwa.tv/nmos/branches/main/docs/Technical_Overview.html#nmos-model-and-terminology
 *
 * The Node is not thread safe, it must be used from the thread(s) running the io_context. The Model it owns is thread
 * safe and may be shared with other threads.
 */
class Node {
  public:
    struct SenderConfiguration {
        std::string label;
        std::string description;
        Transport transport {Transport::rtp_multicast};
    };

    struct ReceiverConfiguration {
        std::string label;
        std::string description;
        Format format {Format::audio};
        Transport transport {Transport::rtp_multicast};
    };

    struct DeviceConfiguration {
        std::string label;
        std::string description;
        std::string type {Device::k_type_generic};
        std::vector<SenderConfiguration> senders;
        std::vector<ReceiverConfiguration> receivers;
    };

    /**
     * The configuration of the NMOS node.
     */
    struct Configuration {
        std::string label;                    // Freeform string label for the Node.
        std::string description;              // Detailed description of the Node.
        std::string hostname;                 // Advertised hostname. When empty the address of the Node API is used.
        std::string api_address {"0.0.0.0"};  // The address the Node API binds to.
        uint16_t api_port {0};                // The port of the Node API. When 0 an ephemeral port is chosen.
        std::vector<DeviceConfiguration> devices;

        /**
         * Checks if the configuration is semantically valid.
         * @return invalid_configuration if a device has no type or the API address is not an IP address.
         */
        [[nodiscard]] boost::system::result<void, Error> validate() const;

        /**
         * @return The configuration as a JSON object.
         */
        [[nodiscard]] boost::json::value to_json() const;

        /**
         * Creates a configuration object from a JSON object. Missing attributes take their default value.
         * @param json The JSON object to convert.
         * @return A configuration object if the JSON is valid, otherwise an error message.
         */
        static boost::system::result<Configuration, std::string> from_json(const boost::json::value& json);
    };

    /**
     * Receives the changes of the registry this node should register with.
     */
    class Subscriber {
      public:
        virtual ~Subscriber() = default;

        /**
         * Called when the active registry changed.
         * @param registry The registry to register with, or an empty optional if no registry is available.
         */
        virtual void nmos_registry_changed(const std::optional<RegistryCandidate>& registry) = 0;
    };

    /**
     * @param io_context The context on which the Node API is served and discovery events are delivered.
     * @param registry_browser The source of registry candidates. When nullptr, registries are discovered using DNS-SD.
     */
    explicit Node(boost::asio::io_context& io_context, std::unique_ptr<RegistryBrowserBase> registry_browser = nullptr);

    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;

    /**
     * Starts the Node API, populates the model with the resources of the configuration and starts discovering
     * registries. The resources are inserted as a whole: when one of them fails, none of them remain.
     * @param configuration The configuration.
     * @return An error if the node fails to start.
     */
    [[nodiscard]] boost::system::result<void, Error> start(const Configuration& configuration);

    /**
     * Stops discovering registries and stops the Node API. Publishes that no registry is available if one was. The
     * model stays valid. Calling stop more than once is allowed.
     */
    void stop();

    /**
     * @return True if the node is started.
     */
    [[nodiscard]] bool is_started() const;

    /**
     * Adds a subscriber. The subscriber is immediately told about the current registry.
     * @param subscriber The subscriber to add.
     * @return True if the subscriber was added, false if it was already added.
     */
    [[nodiscard]] bool subscribe(Subscriber* subscriber);

    /**
     * @param subscriber The subscriber to remove.
     * @return True if the subscriber was removed, false if it was not found.
     */
    [[nodiscard]] bool unsubscribe(const Subscriber* subscriber);

    /**
     * @return The resource model of this node.
     */
    [[nodiscard]] std::shared_ptr<Model> get_model() const;

    /**
     * @return The registry this node should register with, if any.
     */
    [[nodiscard]] const std::optional<RegistryCandidate>& get_active_registry() const;

    /**
     * @return All registries currently known, best ranked first.
     */
    [[nodiscard]] std::vector<RegistryCandidate> get_registry_candidates() const;

    /**
     * @return The configuration the node was last started with successfully.
     */
    [[nodiscard]] const Configuration& get_configuration() const;

    /**
     * @return The local (listening) endpoint of the Node API.
     */
    [[nodiscard]] boost::asio::ip::tcp::endpoint get_local_endpoint() const;

  private:
    std::shared_ptr<Model> model_;
    HttpServer http_server_;
    NodeApi node_api_;
    std::unique_ptr<RegistryBrowserBase> registry_browser_;
    RegistrySelector registry_selector_;
    SubscriberList<Subscriber> subscribers_;
    Configuration configuration_;
    std::optional<boost::uuids::uuid> self_id_;
    bool started_ {false};

    [[nodiscard]] boost::system::result<void, Error>
    populate_model(const Configuration& configuration, const std::string& host, uint16_t port);
};

}  // namespace nmk::nmos
