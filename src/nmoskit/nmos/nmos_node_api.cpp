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

#include "nmoskit/core/assert.hpp"
#include "nmoskit/core/log.hpp"
#include "nmoskit/nmos/detail/nmos_uuid.hpp"
#include "nmoskit/nmos/models/nmos_api_error.hpp"

#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>

#include <algorithm>
#include <optional>

namespace {

namespace http = boost::beast::http;

/**
 * Sets the default headers for the response.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/docs/APIs_-_Server_Side_Implementation_Notes.html#cross-origin-resource-sharing-cors
 */
void set_default_headers(nmk::HttpServer::Response& res, const char* content_type = "application/json") {
    res.set("Content-Type", content_type);
    res.set("Access-Control-Allow-Origin", "*");
    res.set("Access-Control-Allow-Methods", "GET");
    res.set("Access-Control-Allow-Headers", "Content-Type, Accept");
    res.set("Access-Control-Max-Age", "3600");
}

/**
 * Sets the error response with the given status, error message, and debug information.
 * @param res The response to set.
 * @param status The HTTP status code.
 * @param error The error message.
 * @param debug The debug information.
 */
void set_error_response(
    nmk::HttpServer::Response& res, const http::status status, const std::string& error, const std::string& debug
) {
    NMK_WARNING("Node API error {}: {} ({})", static_cast<unsigned>(status), error, debug);
    res.result(status);
    set_default_headers(res);
    res.body() = boost::json::serialize(
        boost::json::value_from(nmk::nmos::ApiError {static_cast<unsigned>(status), error, debug})
    );
    res.prepare_payload();
}

void invalid_api_version_response(nmk::HttpServer::Response& res) {
    set_error_response(
        res, http::status::bad_request, "Invalid API version",
        "Failed to parse a supported version in the form of vMAJOR.MINOR"
    );
}

void ok_response(nmk::HttpServer::Response& res, std::string body) {
    res.result(http::status::ok);
    set_default_headers(res);
    res.body() = std::move(body);
    res.prepare_payload();
}

std::optional<nmk::nmos::ApiVersion> get_valid_api_version_from_parameters(const nmk::PathMatcher::Parameters& params) {
    const auto* version_str = params.get("version");
    if (version_str == nullptr) {
        return std::nullopt;
    }
    const auto version = nmk::nmos::ApiVersion::from_string(*version_str);
    if (!version) {
        return std::nullopt;
    }
    const auto& versions = nmk::nmos::NodeApi::k_api_versions;
    if (std::find(versions.begin(), versions.end(), *version) == versions.end()) {
        return std::nullopt;
    }
    return version;
}

template<class T>
void list_resources_response(const nmk::nmos::Model& model, nmk::HttpServer::Response& res) {
    boost::json::array resources;
    for (const auto& resource : model.list<T>()) {
        resources.push_back(boost::json::value_from(resource));
    }
    ok_response(res, boost::json::serialize(resources));
}

template<class T>
void get_resource_response(
    const nmk::nmos::Model& model, nmk::HttpServer::Response& res, const nmk::PathMatcher::Parameters& params,
    const char* kind
) {
    const auto* id_str = params.get("id");
    if (id_str == nullptr) {
        set_error_response(res, http::status::bad_request, fmt::format("Invalid {} ID", kind), "ID is empty");
        return;
    }

    const auto id = nmk::nmos::uuid_from_string(*id_str);
    if (!id) {
        set_error_response(
            res, http::status::bad_request, fmt::format("Invalid {} ID", kind), "ID is not a valid UUID"
        );
        return;
    }

    const auto resource = model.get<T>(*id);
    if (!resource) {
        set_error_response(
            res, http::status::not_found, fmt::format("{} not found", kind),
            fmt::format("No {} with ID {}", kind, *id_str)
        );
        return;
    }

    ok_response(res, boost::json::serialize(boost::json::value_from(*resource)));
}

}  // namespace

nmk::nmos::NodeApi::NodeApi(HttpServer& http_server, std::shared_ptr<const Model> model) : model_(std::move(model)) {
    NMK_ASSERT(model_ != nullptr, "A model is required");

    http_server.get("/", [](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters&) {
        ok_response(res, boost::json::serialize(boost::json::array({"x-nmos/"})));
    });

    http_server.get(
        "/x-nmos",
        [](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters&) {
            ok_response(res, boost::json::serialize(boost::json::array({"node/"})));
        }
    );

    http_server.get(
        "/x-nmos/node",
        [](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters&) {
            boost::json::array versions;
            for (const auto& version : k_api_versions) {
                versions.emplace_back(fmt::format("{}/", version.to_string()));
            }
            ok_response(res, boost::json::serialize(versions));
        }
    );

    http_server.get(
        "/x-nmos/node/{version}",
        [](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            ok_response(
                res,
                boost::json::serialize(
                    boost::json::array({"self/", "sources/", "flows/", "devices/", "senders/", "receivers/"})
                )
            );
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/self",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            const auto self = model->get_self();
            if (!self) {
                set_error_response(res, http::status::not_found, "Node not found", "The node is not initialized");
                return;
            }
            ok_response(res, boost::json::serialize(boost::json::value_from(*self)));
        }
    );

    // Sources and flows are not modeled
    for (const auto* pattern : {"/x-nmos/node/{version}/sources", "/x-nmos/node/{version}/flows"}) {
        http_server.get(
            pattern,
            [](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
                if (!get_valid_api_version_from_parameters(params)) {
                    return invalid_api_version_response(res);
                }
                ok_response(res, boost::json::serialize(boost::json::array()));
            }
        );
    }

    http_server.get(
        "/x-nmos/node/{version}/devices",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            list_resources_response<Device>(*model, res);
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/devices/{id}",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            get_resource_response<Device>(*model, res, params, "Device");
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/senders",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            list_resources_response<Sender>(*model, res);
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/senders/{id}",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            get_resource_response<Sender>(*model, res, params, "Sender");
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/receivers",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            list_resources_response<Receiver>(*model, res);
        }
    );

    http_server.get(
        "/x-nmos/node/{version}/receivers/{id}",
        [model = model_](const HttpServer::Request&, HttpServer::Response& res, const PathMatcher::Parameters& params) {
            if (!get_valid_api_version_from_parameters(params)) {
                return invalid_api_version_response(res);
            }
            get_resource_response<Receiver>(*model, res, params, "Receiver");
        }
    );
}
