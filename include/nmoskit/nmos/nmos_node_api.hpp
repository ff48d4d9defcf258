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
#include "detail/nmos_api_version.hpp"
#include "nmoskit/core/net/http/http_server.hpp"

#include <array>
#include <memory>

namespace nmk::nmos {

/**
 * Read only IS-04 Node API. Serves the resources of a Model.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/NodeAPI.html
 */
class NodeApi {
  public:
    /// The Node API versions which are served.
    static constexpr std::array<ApiVersion, 2> k_api_versions {{ApiVersion::v1_2(), ApiVersion::v1_3()}};

    /**
     * Adds the routes of the Node API to the server. The server must not be started yet. The routes share ownership
     * of the model, so they keep serving it when the server outlives this object.
     * @param http_server The server to add the routes to.
     * @param model The model to serve.
     */
    NodeApi(HttpServer& http_server, std::shared_ptr<const Model> model);

    NodeApi(const NodeApi&) = delete;
    NodeApi& operator=(const NodeApi&) = delete;

    NodeApi(NodeApi&&) = delete;
    NodeApi& operator=(NodeApi&&) = delete;

  private:
    std::shared_ptr<const Model> model_;
};

}  // namespace nmk::nmos
