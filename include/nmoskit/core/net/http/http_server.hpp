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

#include "nmoskit/core/util/path_matcher.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/system/result.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace nmk {

/**
 * A high-level wrapper around boost::beast for creating an HTTP server.
 * Each client session runs on its own strand, so the io_context may be run from multiple threads. Handlers can
 * therefore be invoked concurrently and must be thread safe.
 */
class HttpServer {
  public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler = std::function<void(const Request&, Response&, const PathMatcher::Parameters&)>;

    /// The time to wait for a request before closing the connection.
    static constexpr auto k_timeout_seconds = 5;

    /**
     * Constructs a new HttpServer using the given io_context.
     * @param io_context The io_context to use for the server.
     */
    explicit HttpServer(boost::asio::io_context& io_context);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /**
     * Starts the server on the given address and port.
     * @param bind_address The address to bind to.
     * @param port The port to bind to. When 0, an ephemeral port is chosen.
     * @return An error code if the server fails to start, or an empty result if it succeeds.
     */
    boost::system::result<void> start(std::string_view bind_address, uint16_t port);

    /**
     * Stops the server and closes all client sessions. Can be called multiple times.
     */
    void stop();

    /**
     * @return The local (listening) endpoint of the server.
     */
    [[nodiscard]] boost::asio::ip::tcp::endpoint get_local_endpoint() const;

    /**
     * @return The number of active client sessions.
     */
    [[nodiscard]] size_t get_client_count() const;

    /**
     * Adds a handler for GET requests to the given pattern. Must be called before start().
     * @param pattern The pattern to match against the request path.
     * @param handler The handler to call when a request matches the pattern.
     */
    void get(std::string_view pattern, Handler handler);

    /**
     * Routes the request to the matching handler and produces the response. This is what client sessions call for
     * every request they read.
     * @param request The request to handle.
     * @return The response.
     */
    [[nodiscard]] Response handle_request(const Request& request) const;

  private:
    class Listener;
    class ClientSession;
    struct Context;

    boost::asio::io_context& io_context_;
    std::shared_ptr<Context> context_;
    std::shared_ptr<Listener> listener_;
};

}  // namespace nmk
