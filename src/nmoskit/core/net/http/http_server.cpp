/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/net/http/http_server.hpp"

#include "nmoskit/core/assert.hpp"
#include "nmoskit/core/log.hpp"
#include "nmoskit/core/util/stl_helpers.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <mutex>
#include <vector>

/**
 * State shared by the server, its listener and its client sessions. Sessions keep it alive while they are closing,
 * which may happen after the server itself is gone.
 */
struct nmk::HttpServer::Context {
    struct Route {
        boost::beast::http::verb method {};
        std::string pattern;
        Handler handler;
    };

    std::vector<Route> routes;  // Not modified while the server is running.

    mutable std::mutex mutex;
    std::vector<std::shared_ptr<ClientSession>> sessions;
    bool stopped = false;

    [[nodiscard]] Response handle_request(const Request& request) const;
    bool add_session(std::shared_ptr<ClientSession> session);
    void remove_session(const ClientSession* session);
};

class nmk::HttpServer::ClientSession: public std::enable_shared_from_this<ClientSession> {
  public:
    ClientSession() = delete;

    ClientSession(boost::asio::ip::tcp::socket&& socket, std::shared_ptr<Context> context) :
        stream_(std::move(socket)), context_(std::move(context)) {
        NMK_ASSERT(context_ != nullptr, "Context cannot be null");
    }

    void start() {
        boost::asio::dispatch(
            stream_.get_executor(), boost::beast::bind_front_handler(&ClientSession::do_read, shared_from_this())
        );
    }

    /**
     * Closes the session from any thread.
     */
    void close() {
        boost::asio::post(
            stream_.get_executor(), boost::beast::bind_front_handler(&ClientSession::do_close, shared_from_this())
        );
    }

  private:
    boost::beast::tcp_stream stream_;
    std::shared_ptr<Context> context_;
    boost::beast::flat_buffer buffer_;
    Request request_;

    void do_read() {
        // Make the request empty before reading, otherwise the operation behavior is undefined.
        request_ = {};

        stream_.expires_after(std::chrono::seconds(k_timeout_seconds));

        boost::beast::http::async_read(
            stream_, buffer_, request_, boost::beast::bind_front_handler(&ClientSession::on_read, shared_from_this())
        );
    }

    void on_read(const boost::beast::error_code& ec, std::size_t bytes_transferred) {
        std::ignore = bytes_transferred;

        // This means they closed the connection
        if (ec == boost::beast::http::error::end_of_stream) {
            return do_close();
        }

        if (ec) {
            log_error(ec, "read");
            return do_close();
        }

        auto response = context_->handle_request(request_);
        send_response(std::move(response));
    }

    void send_response(Response&& response) {
        const bool keep_alive = response.keep_alive();
        auto message = std::make_shared<Response>(std::move(response));

        boost::beast::http::async_write(
            stream_, *message,
            [self = shared_from_this(), message, keep_alive](const boost::beast::error_code& ec, std::size_t) {
                self->on_write(keep_alive, ec);
            }
        );
    }

    void on_write(const bool keep_alive, const boost::beast::error_code& ec) {
        if (ec) {
            log_error(ec, "write");
            return do_close();
        }

        if (!keep_alive) {
            return do_close();
        }

        do_read();
    }

    void do_close() {
        auto& socket = stream_.socket();
        if (socket.is_open()) {
            boost::beast::error_code ec;
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
            if (ec && ec != boost::beast::errc::not_connected) {
                log_error(ec, "shutdown");
            }
            socket.close(ec);
        }
        context_->remove_session(this);
    }

    static void log_error(const boost::beast::error_code& ec, std::string_view what) {
        if (ec == boost::beast::error::timeout || ec == boost::asio::error::operation_aborted) {
            NMK_TRACE("Client session {}: {}", what, ec.message());
        } else {
            NMK_ERROR("Client session error: {}: {}", what, ec.message());
        }
    }
};

class nmk::HttpServer::Listener: public std::enable_shared_from_this<Listener> {
  public:
    Listener(boost::asio::io_context& io_context, std::shared_ptr<Context> context) :
        io_context_(io_context), context_(std::move(context)), acceptor_(boost::asio::make_strand(io_context)) {}

    boost::system::result<void> start(const boost::asio::ip::tcp::endpoint& endpoint) {
        boost::system::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            return ec;
        }

        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) {
            return ec;
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            return ec;
        }

        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            return ec;
        }

        local_endpoint_ = acceptor_.local_endpoint(ec);
        if (ec) {
            return ec;
        }

        do_accept();

        return {};
    }

    /**
     * Closes the acceptor from any thread.
     */
    void close() {
        boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
            boost::system::error_code ec;
            self->acceptor_.close(ec);
            if (ec) {
                NMK_ERROR("Error closing acceptor: {}", ec.message());
            }
        });
    }

    [[nodiscard]] const boost::asio::ip::tcp::endpoint& local_endpoint() const {
        return local_endpoint_;
    }

  private:
    boost::asio::io_context& io_context_;
    std::shared_ptr<Context> context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::endpoint local_endpoint_;

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(io_context_),
            boost::beast::bind_front_handler(&Listener::on_accept, shared_from_this())
        );
    }

    void on_accept(const boost::beast::error_code& ec, boost::asio::ip::tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted) {
            return;  // Acceptor was closed
        }

        if (ec) {
            NMK_ERROR("Listener error: accept: {}", ec.message());
            return;  // To avoid infinite loop
        }

        auto session = std::make_shared<ClientSession>(std::move(socket), context_);
        if (!context_->add_session(session)) {
            return;  // Server was stopped
        }
        session->start();
        do_accept();
    }
};

nmk::HttpServer::Response nmk::HttpServer::Context::handle_request(const Request& request) const {
    const auto target = std::string_view(request.target().data(), request.target().size());
    const auto path = target.substr(0, target.find('?'));

    NMK_DEBUG("{} {}", std::string_view(request.method_string().data(), request.method_string().size()), target);

    try {
        PathMatcher::Parameters parameters;

        for (const auto& route : routes) {
            if (route.method != request.method()) {
                continue;
            }

            parameters.clear();
            const auto match_result = PathMatcher::match(path, route.pattern, &parameters);
            if (match_result.has_error()) {
                NMK_ERROR("Error matching path: {}", match_result.error());
                continue;
            }
            if (!match_result.value()) {
                continue;
            }

            Response response;
            response.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
            response.keep_alive(request.keep_alive());
            response.version(request.version());
            route.handler(request, response, parameters);

            const auto result_int = response.result_int();
            if (result_int < 200 || result_int >= 300) {
                NMK_WARNING(
                    "{} {} {}", result_int,
                    std::string_view(response.reason().data(), response.reason().size()), response.body()
                );
            }
            return response;
        }

        Response response {boost::beast::http::status::not_found, request.version()};
        response.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
        response.set(boost::beast::http::field::content_type, "text/plain");
        response.keep_alive(request.keep_alive());
        response.body() = "No matching handler";
        response.prepare_payload();
        NMK_WARNING("No matching handler for {}", target);
        return response;
    } catch (const std::exception& e) {
        NMK_ERROR("Exception in handler: {}", e.what());
        Response response {boost::beast::http::status::internal_server_error, request.version()};
        response.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
        response.set(boost::beast::http::field::content_type, "text/plain");
        response.keep_alive(request.keep_alive());
        response.body() = "Internal server error";
        response.prepare_payload();
        return response;
    }
}

bool nmk::HttpServer::Context::add_session(std::shared_ptr<ClientSession> session) {
    std::lock_guard lock(mutex);
    if (stopped) {
        return false;
    }
    sessions.push_back(std::move(session));
    return true;
}

void nmk::HttpServer::Context::remove_session(const ClientSession* session) {
    std::lock_guard lock(mutex);
    stl_remove_if(sessions, [session](const auto& s) {
        return s.get() == session;
    });
}

nmk::HttpServer::HttpServer(boost::asio::io_context& io_context) :
    io_context_(io_context), context_(std::make_shared<Context>()) {}

nmk::HttpServer::~HttpServer() {
    stop();
}

boost::system::result<void> nmk::HttpServer::start(const std::string_view bind_address, const uint16_t port) {
    if (listener_ != nullptr) {
        return boost::asio::error::already_started;
    }

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(bind_address, ec);
    if (ec) {
        return ec;
    }

    {
        std::lock_guard lock(context_->mutex);
        context_->stopped = false;
    }

    auto listener = std::make_shared<Listener>(io_context_, context_);
    auto result = listener->start({address, port});
    if (result.has_error()) {
        return result;
    }

    listener_ = std::move(listener);

    const auto& endpoint = listener_->local_endpoint();
    NMK_INFO("HTTP server listening on {}:{}", endpoint.address().to_string(), endpoint.port());

    return {};
}

void nmk::HttpServer::stop() {
    if (listener_) {
        listener_->close();
        listener_.reset();
    }

    std::vector<std::shared_ptr<ClientSession>> sessions;
    {
        std::lock_guard lock(context_->mutex);
        context_->stopped = true;
        sessions.swap(context_->sessions);
    }

    for (const auto& session : sessions) {
        session->close();
    }
}

boost::asio::ip::tcp::endpoint nmk::HttpServer::get_local_endpoint() const {
    return listener_ ? listener_->local_endpoint() : boost::asio::ip::tcp::endpoint {};
}

size_t nmk::HttpServer::get_client_count() const {
    std::lock_guard lock(context_->mutex);
    return context_->sessions.size();
}

void nmk::HttpServer::get(const std::string_view pattern, Handler handler) {
    NMK_ASSERT(!pattern.empty(), "Pattern cannot be empty");
    NMK_ASSERT(handler != nullptr, "Handler cannot be null");
    NMK_ASSERT(listener_ == nullptr, "Routes must be added before the server is started");

    for (auto& route : context_->routes) {
        if (route.method == boost::beast::http::verb::get && route.pattern == pattern) {
            route.handler = std::move(handler);
            return;
        }
    }

    context_->routes.push_back({boost::beast::http::verb::get, std::string(pattern), std::move(handler)});
}

nmk::HttpServer::Response nmk::HttpServer::handle_request(const Request& request) const {
    return context_->handle_request(request);
}
