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

// vcadmin Admin Server - Header
// Administrative HTTP surface: liveness/readiness probes, reset, API docs
// One accept thread hands each connection to its own short-lived worker

#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "../control/config.hpp"
#include "../control/health.hpp"
#include "../control/stats.hpp"
#include "../gateway/api_key_middleware.hpp"
#include "../gateway/pipeline.hpp"
#include "../gateway/router.hpp"
#include "../http/http.hpp"
#include "profile.hpp"

namespace vcadmin::core {

/// Admin status server
/// Lifecycle: (alive, ready) = (F,F) -> start() -> (T,T) -> stop() -> (F,F)
/// No restart within one instance
class AdminServer {
public:
    /// 'profile' defaults to a profile named after the agent label
    /// 'authenticator' defaults to ApiKeyAuthenticator over admin.api_key
    explicit AdminServer(const control::Config& config,
                         std::shared_ptr<const Profile> profile = nullptr,
                         std::shared_ptr<control::Collector> collector = nullptr,
                         std::shared_ptr<const gateway::Authenticator> authenticator = nullptr);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Bind server.listen_address:server.listen_port and start serving
    [[nodiscard]] std::error_code start();

    /// Bind host:port (0 = ephemeral) and start serving
    /// On success alive and ready become true; on failure flags are untouched
    [[nodiscard]] std::error_code start(std::string_view host, uint16_t port);

    /// Graceful stop: ready=false first, then close the listener and join
    /// every connection worker (idempotent)
    void stop();

    /// Fatal error signalled by the host: alive=ready=false, listener stays open
    void notify_fatal_error();

    /// Administrative reset: ready=false, alive unchanged
    void reset_ready();

    /// Run one parsed request through the pipeline and route table
    /// Safe to call from several threads at once
    void handle_request(http::Request& request, http::Response& response,
                        std::string_view client_ip = {}, uint16_t client_port = 0);

    /// Register (or replace) a route, also while serving
    /// Must not be called from inside a route handler
    void add_route(gateway::Route route);

    /// Registered paths in registration order
    [[nodiscard]] std::vector<std::string> route_paths() const;

    /// Enable CORS on every route currently registered
    void apply_cors();

    /// Connections currently held by a worker
    [[nodiscard]] size_t active_connections() const;

    [[nodiscard]] bool is_live() const noexcept { return state_.is_live(); }
    [[nodiscard]] bool is_ready() const noexcept { return state_.is_ready(); }
    [[nodiscard]] const control::ServerState& state() const noexcept { return state_; }

    /// Check if server is running
    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Bound port (resolved when started with port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }

private:
    /// Accepted client connection, served on its own worker thread
    struct Connection {
        int fd = -1;
        std::string client_ip;
        uint16_t client_port = 0;
        std::thread worker;
        std::atomic<bool> done{false};
    };

    /// Register routes, then CORS, then the middleware chain
    void make_application();

    /// Accept loop (runs on thread_)
    void run();

    /// Worker body: serve one connection, close it, mark it done
    void serve_connection(std::shared_ptr<Connection> connection);

    /// Join finished workers, or every worker when 'all' is set
    void reap_connections(bool all);

    /// Read one request within the deadline, answer it
    void handle_connection(int client_fd, const std::string& client_ip, uint16_t client_port);

    /// Route to handler, or 404/405
    void dispatch(gateway::RequestContext& ctx);

    /// Serialize and write, logging write failures
    void send_response(int client_fd, const http::Response& response);

    // Handlers
    void redirect_handler(gateway::RequestContext& ctx) const;
    void liveliness_handler(gateway::RequestContext& ctx) const;
    void readiness_handler(gateway::RequestContext& ctx) const;
    void status_reset_handler(gateway::RequestContext& ctx) const;

    const control::Config config_;
    std::shared_ptr<const Profile> profile_;
    std::shared_ptr<control::Collector> collector_;
    std::shared_ptr<const gateway::Authenticator> authenticator_;

    control::ServerState state_;

    // Guards router_ and the CORS path set; shared across match and dispatch
    mutable std::shared_mutex routes_mutex_;
    gateway::Router router_;
    gateway::Pipeline pipeline_;
    gateway::CorsMiddleware* cors_ = nullptr;  // Owned by pipeline_

    std::mutex lifecycle_mutex_;
    std::thread thread_;

    mutable std::mutex connections_mutex_;
    std::list<std::shared_ptr<Connection>> connections_;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    bool stopped_ = false;
    std::string host_;
    uint16_t port_ = 0;
};

}  // namespace vcadmin::core
