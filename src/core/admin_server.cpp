/*
 * Copyright 2025 vcadmin Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// vcadmin Admin Server - Implementation

#include "admin_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include <nlohmann/json.hpp>

#include "../control/openapi.hpp"
#include "../http/parser.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace vcadmin::core {

namespace {

// Accept loop and connection workers wake this often to observe stop()
constexpr int kPollIntervalMs = 100;
constexpr size_t kRecvChunkSize = 4096;

nlohmann::json flag_schema(const char* name, const char* description) {
    return {{"type", "object"},
            {"properties",
             {{name, {{"type", "boolean"}, {"description", description}, {"example", true}}}}}};
}

std::string peer_address(const sockaddr_storage& addr, uint16_t& port) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        port = ntohs(in6->sin6_port);
    }
    return buf;
}

}  // namespace

AdminServer::AdminServer(const control::Config& config, std::shared_ptr<const Profile> profile,
                         std::shared_ptr<control::Collector> collector,
                         std::shared_ptr<const gateway::Authenticator> authenticator)
    : config_(config),
      profile_(std::move(profile)),
      collector_(std::move(collector)),
      authenticator_(std::move(authenticator)) {
    if (!profile_) {
        profile_ = std::make_shared<const Profile>(config_.openapi.label);
    }
    if (!authenticator_) {
        authenticator_ = std::make_shared<const gateway::ApiKeyAuthenticator>(
            config_.admin.api_key, config_.admin.api_key_header);
    }
    make_application();
}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::make_application() {
    router_.add_route(gateway::RouteBuilder("/")
                          .method(http::Method::GET)
                          .handler("redirect",
                                   [this](gateway::RequestContext& ctx) { redirect_handler(ctx); })
                          .allow_head()
                          .undocumented()
                          .build());

    router_.add_route(
        gateway::RouteBuilder("/status/reset")
            .method(http::Method::POST)
            .handler("status_reset",
                     [this](gateway::RequestContext& ctx) { status_reset_handler(ctx); })
            .tag("server")
            .summary("Reset statistics")
            .response_schema("AdminResetSchema",
                             {{"type", "object"}, {"properties", nlohmann::json::object()}})
            .build());

    router_.add_route(
        gateway::RouteBuilder("/status/live")
            .method(http::Method::GET)
            .handler("status_live",
                     [this](gateway::RequestContext& ctx) { liveliness_handler(ctx); })
            .tag("server")
            .summary("Liveliness check")
            .response_schema("AdminStatusLivelinessSchema",
                             flag_schema("alive", "Liveliness status"))
            .build());

    router_.add_route(
        gateway::RouteBuilder("/status/ready")
            .method(http::Method::GET)
            .handler("status_ready",
                     [this](gateway::RequestContext& ctx) { readiness_handler(ctx); })
            .tag("server")
            .summary("Readiness check")
            .response_schema("AdminStatusReadinessSchema",
                             flag_schema("ready", "Readiness status"))
            .build());

    control::OpenApiExporter(config_.openapi, config_.admin.api_key_header).attach(router_);

    // CORS preflight first, so 401 replies still carry CORS headers
    gateway::CorsMiddleware::Config cors_config;
    cors_config.enabled = config_.cors.enabled;
    cors_config.allowed_origins = config_.cors.allowed_origins;
    cors_config.allowed_methods = config_.cors.allowed_methods;
    cors_config.allowed_headers = config_.cors.allowed_headers;
    cors_config.expose_headers = config_.cors.expose_headers;
    cors_config.allow_credentials = config_.cors.allow_credentials;
    cors_config.max_age = static_cast<int>(config_.cors.max_age);

    auto cors = std::make_unique<gateway::CorsMiddleware>(std::move(cors_config));
    cors_ = cors.get();

    gateway::ApiKeyMiddleware::Config auth_config;
    auth_config.enabled = !config_.admin.insecure_mode;
    auth_config.exempt_unprotected_paths = config_.admin.exempt_unprotected_paths;
    auth_config.unprotected_paths = config_.admin.unprotected_paths;
    auth_config.unprotected_prefixes = config_.admin.unprotected_prefixes;

    pipeline_ = gateway::PipelineBuilder()
                    .use(std::move(cors))
                    .use(std::make_unique<gateway::ApiKeyMiddleware>(std::move(auth_config),
                                                                     authenticator_))
                    .use(std::make_unique<gateway::AdminContextMiddleware>(profile_))
                    .use(std::make_unique<gateway::LoggingMiddleware>())
                    .build();

    // Applied last so every route registered above is covered
    apply_cors();
}

void AdminServer::add_route(gateway::Route route) {
    std::unique_lock lock(routes_mutex_);
    router_.add_route(std::move(route));
}

std::vector<std::string> AdminServer::route_paths() const {
    std::shared_lock lock(routes_mutex_);
    return router_.paths();
}

void AdminServer::apply_cors() {
    std::unique_lock lock(routes_mutex_);
    if (cors_) {
        cors_->enable_for(router_);
    }
}

size_t AdminServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return static_cast<size_t>(std::count_if(
        connections_.begin(), connections_.end(),
        [](const auto& connection) { return !connection->done.load(std::memory_order_acquire); }));
}

std::error_code AdminServer::start() {
    return start(config_.server.listen_address, config_.server.listen_port);
}

std::error_code AdminServer::start(std::string_view host, uint16_t port) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.load(std::memory_order_acquire)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }
    if (stopped_) {
        return std::make_error_code(std::errc::operation_not_permitted);
    }

    auto* logger = logging::get_current_logger();

    std::error_code ec;
    int fd = create_listening_socket(host, port, static_cast<int>(config_.server.backlog), ec);
    if (fd < 0) {
        if (logger) {
            LOG_ERROR(logger, "Unable to start admin server with host '{}' and port '{}': {}",
                      host, port, ec.message());
        }
        return ec;
    }

    listen_fd_ = fd;
    host_ = std::string(host);
    port_ = local_port(fd);

    state_.set_alive(true);
    state_.set_ready(true);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&AdminServer::run, this);

    if (logger) {
        LOG_INFO(logger, "Admin server listening on {}:{}", host_, port_);
        if (config_.admin.insecure_mode) {
            LOG_WARNING(logger, "Admin API key check disabled (insecure_mode)");
        }
        LOG_STATE(logger, "started", state_.is_live(), state_.ready_flag());
    }

    return {};
}

void AdminServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    // Probes fail before the listener goes away
    state_.set_ready(false);

    const bool was_running = running_.exchange(false, std::memory_order_acq_rel);

    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }

    // Workers see running_ == false within one poll interval
    reap_connections(true);

    state_.set_alive(false);

    if (was_running) {
        stopped_ = true;
        if (auto* logger = logging::get_current_logger()) {
            LOG_STATE(logger, "stopped", state_.is_live(), state_.ready_flag());
        }
    }
}

void AdminServer::notify_fatal_error() {
    state_.set_alive(false);
    state_.set_ready(false);

    if (auto* logger = logging::get_current_logger()) {
        LOG_ERROR(logger, "Received shutdown request notify_fatal_error()");
        LOG_STATE(logger, "fatal", state_.is_live(), state_.ready_flag());
    }
}

void AdminServer::reset_ready() {
    state_.set_ready(false);

    if (auto* logger = logging::get_current_logger()) {
        LOG_STATE(logger, "reset", state_.is_live(), state_.ready_flag());
    }
}

void AdminServer::run() {
    while (running_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (auto* logger = logging::get_current_logger()) {
                LOG_ERROR(logger, "Admin listener poll failed: {}", std::strerror(errno));
            }
            break;
        }
        if (rc == 0) {
            continue;  // Timeout, re-check running_
        }

        sockaddr_storage client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED) {
                continue;
            }
            if (auto* logger = logging::get_current_logger()) {
                LOG_WARNING(logger, "Admin accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        reap_connections(false);

        auto connection = std::make_shared<Connection>();
        connection->fd = client_fd;
        connection->client_ip = peer_address(client_addr, connection->client_port);

        if (active_connections() >= config_.server.max_connections) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_WARNING(logger, "Admin connection limit ({}) reached, rejecting {}",
                            config_.server.max_connections, connection->client_ip);
            }
            http::Response response;
            gateway::respond_error(response, http::StatusCode::ServiceUnavailable,
                                   "Service Unavailable");
            send_response(client_fd, response);
            close_fd(client_fd);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back(connection);
        }
        try {
            connection->worker = std::thread(&AdminServer::serve_connection, this, connection);
        } catch (const std::system_error& e) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_ERROR(logger, "Cannot start admin connection worker: {}", e.what());
            }
            close_fd(client_fd);
            connection->done.store(true, std::memory_order_release);
        }
    }
}

void AdminServer::serve_connection(std::shared_ptr<Connection> connection) {
    handle_connection(connection->fd, connection->client_ip, connection->client_port);
    close_fd(connection->fd);
    connection->done.store(true, std::memory_order_release);
}

void AdminServer::reap_connections(bool all) {
    std::list<std::shared_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (all || (*it)->done.load(std::memory_order_acquire)) {
                auto next = std::next(it);
                finished.splice(finished.end(), connections_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }

    for (auto& connection : finished) {
        if (!connection->worker.joinable()) {
            continue;
        }
        if (connection->worker.get_id() == std::this_thread::get_id()) {
            // stop() called from a handler: this worker finishes on its own
            connection->worker.detach();
        } else {
            connection->worker.join();
        }
    }
}

void AdminServer::handle_connection(int client_fd, const std::string& client_ip,
                                    uint16_t client_port) {
    // Whole request must arrive before this, however it is split into packets
    const bool has_deadline = config_.server.read_timeout_ms > 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.server.read_timeout_ms);

    const size_t max_body = static_cast<size_t>(config_.server.max_request_size_mb) * 1024 * 1024;
    const size_t max_buffer = max_body + config_.server.max_header_size;

    std::string buffer;
    buffer.reserve(kRecvChunkSize);
    char chunk[kRecvChunkSize];

    http::Parser parser;
    http::Response response;

    while (running_.load(std::memory_order_acquire)) {
        int wait_ms = kPollIntervalMs;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                gateway::respond_error(response, http::StatusCode::RequestTimeout,
                                       "Request Timeout");
                send_response(client_fd, response);
                return;
            }
            wait_ms = static_cast<int>(std::min<int64_t>(wait_ms, remaining.count()));
        }

        pollfd pfd{};
        pfd.fd = client_fd;
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (auto* logger = logging::get_current_logger()) {
                LOG_DEBUG(logger, "Admin client poll failed: {}", std::strerror(errno));
            }
            return;
        }
        if (rc == 0) {
            continue;  // Re-check deadline and running_
        }

        ssize_t n = recv(client_fd, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return;
        }
        if (n == 0) {
            return;  // Peer closed before a full request arrived
        }
        buffer.append(chunk, static_cast<size_t>(n));

        // Re-parse from the start so every view points into the current buffer
        parser.reset();
        http::Request request;
        auto [result, consumed] = parser.parse_request(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(buffer.data()),
                                     buffer.size()),
            request);
        (void)consumed;

        if (result == http::ParseResult::Error) {
            if (auto* logger = logging::get_current_logger()) {
                LOG_DEBUG(logger, "Malformed admin request from {}: {}", client_ip,
                          parser.error_message());
            }
            gateway::respond_error(response, http::StatusCode::BadRequest, "Bad Request");
            send_response(client_fd, response);
            return;
        }

        if (result == http::ParseResult::Incomplete) {
            bool declared_too_large =
                parser.headers_complete() && request.content_length() > max_body;
            if (declared_too_large || buffer.size() > max_buffer) {
                gateway::respond_error(response, http::StatusCode::PayloadTooLarge,
                                       "Request Entity Too Large");
                send_response(client_fd, response);
                return;
            }
            continue;
        }

        if (request.body_size() > max_body) {
            gateway::respond_error(response, http::StatusCode::PayloadTooLarge,
                                   "Request Entity Too Large");
            send_response(client_fd, response);
            return;
        }

        handle_request(request, response, client_ip, client_port);
        send_response(client_fd, response);
        return;
    }
}

void AdminServer::handle_request(http::Request& request, http::Response& response,
                                 std::string_view client_ip, uint16_t client_port) {
    // Held until the response phase ends: route pointers and CORS paths stay valid
    std::shared_lock routes_lock(routes_mutex_);

    gateway::RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;

    // Keep a well-formed caller ID so one trace spans the calling service and this server
    std::string_view inbound_id = request.get_header("X-Correlation-ID");
    ctx.correlation_id = logging::is_valid_correlation_id(inbound_id)
                             ? std::string(inbound_id)
                             : logging::generate_correlation_id();
    ctx.client_ip = std::string(client_ip);
    ctx.client_port = client_port;
    ctx.collector = collector_.get();
    ctx.start_time = std::chrono::steady_clock::now();
    ctx.route_match = router_.match(request.method, request.path);

    auto result = pipeline_.execute_request(ctx);
    if (result == gateway::MiddlewareResult::Continue) {
        dispatch(ctx);
    } else if (result == gateway::MiddlewareResult::Error) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Admin request pipeline failed", ctx.correlation_id, 500,
                          ctx.error_message);
        }
        gateway::respond_error(response, http::StatusCode::InternalServerError,
                               "Internal Server Error");
    }

    response.set_header("X-Correlation-ID", ctx.correlation_id);

    if (pipeline_.execute_response(ctx) == gateway::MiddlewareResult::Error) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Admin response pipeline failed", ctx.correlation_id, 500,
                          ctx.error_message);
        }
    }

    if (request.method == http::Method::HEAD) {
        response.head_only = true;
    }
}

void AdminServer::dispatch(gateway::RequestContext& ctx) {
    auto& response = *ctx.response;

    if (!ctx.route_match.matched()) {
        if (ctx.route_match.path_found) {
            std::string allow;
            for (auto method : ctx.route_match.allowed_methods) {
                if (!allow.empty()) {
                    allow += ", ";
                }
                allow += http::to_string(method);
            }
            gateway::respond_error(response, http::StatusCode::MethodNotAllowed,
                                   "Method Not Allowed");
            response.set_header("Allow", allow);
        } else {
            gateway::respond_error(response, http::StatusCode::NotFound, "Not Found");
        }
        return;
    }

    try {
        ctx.route_match.route->handler(ctx);
    } catch (const std::exception& e) {
        // Internal detail goes to the log only
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Admin handler failed", ctx.correlation_id, 500, e.what());
        }
        response = http::Response{};
        gateway::respond_error(response, http::StatusCode::InternalServerError,
                               "Internal Server Error");
    }
}

void AdminServer::send_response(int client_fd, const http::Response& response) {
    if (auto ec = send_all(client_fd, response.serialize()); ec) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "Admin response write failed: {}", ec.message());
        }
    }
}

// Handlers

void AdminServer::redirect_handler(gateway::RequestContext& ctx) const {
    ctx.response->status = http::StatusCode::Found;
    ctx.response->set_header("Location", config_.openapi.doc_path);
    ctx.response->body.clear();
}

void AdminServer::liveliness_handler(gateway::RequestContext& ctx) const {
    control::HealthResponse::liveness(state_, *ctx.response);
}

void AdminServer::readiness_handler(gateway::RequestContext& ctx) const {
    control::HealthResponse::readiness(state_, *ctx.response);
}

void AdminServer::status_reset_handler(gateway::RequestContext& ctx) const {
    if (ctx.collector) {
        ctx.collector->reset();
    }
    gateway::respond_json(*ctx.response, http::StatusCode::OK, nlohmann::json::object());
}

}  // namespace vcadmin::core
