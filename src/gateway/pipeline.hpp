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

// vcadmin Pipeline - Header
// Middleware chain for admin request processing

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/containers.hpp"
#include "../core/profile.hpp"
#include "../http/http.hpp"
#include "router.hpp"

namespace vcadmin::control {
class Collector;
}

namespace vcadmin::gateway {

/// Request context (passed through both middleware phases and the handler)
struct RequestContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Routing
    RouteMatch route_match;

    // Connection info
    std::string client_ip;
    uint16_t client_port = 0;

    // Attached by AdminContextMiddleware after authentication
    std::optional<core::AdminRequestContext> admin_context;

    // Optional timing collector (reset by POST /status/reset)
    control::Collector* collector = nullptr;

    // Metadata (for middleware communication)
    core::fast_map<std::string, std::string> metadata;

    // Timing
    std::chrono::steady_clock::time_point start_time;

    // Error handling
    bool has_error = false;
    std::string error_message;

    /// Helper: Set error
    void set_error(std::string message) {
        has_error = true;
        error_message = std::move(message);
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (response already written)
    Error      // Error occurred
};

/// Middleware function signature
using MiddlewareFunc = std::function<MiddlewareResult(RequestContext&)>;

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before the route handler)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after the handler, or after a short-circuit)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_response(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Logging middleware (logs in response phase with timing)
class LoggingMiddleware : public Middleware {
public:
    MiddlewareResult process_response(RequestContext& ctx) override;
    std::string_view name() const override { return "LoggingMiddleware"; }
};

/// CORS middleware
/// Preflight is answered in the request phase, actual-request headers are
/// added in the response phase so they also decorate short-circuited replies
class CorsMiddleware : public Middleware {
public:
    struct Config {
        bool enabled;
        std::vector<std::string> allowed_origins;
        std::vector<std::string> allowed_methods;
        std::vector<std::string> allowed_headers;
        std::vector<std::string> expose_headers;
        bool allow_credentials;
        int max_age;

        Config()
            : enabled(true),
              allowed_origins{"*"},
              allowed_methods{"*"},
              allowed_headers{"*"},
              expose_headers{"*"},
              allow_credentials(true),
              max_age(86400) {}
    };

    CorsMiddleware() : config_() {}
    explicit CorsMiddleware(Config config) : config_(std::move(config)) {}

    /// Enable CORS on every path currently registered in 'router'
    /// Call again after adding routes
    void enable_for(const Router& router);

    /// Enable CORS on a single path
    void enable_path(std::string path);

    [[nodiscard]] bool is_enabled_for(std::string_view path) const;

    MiddlewareResult process_request(RequestContext& ctx) override;
    MiddlewareResult process_response(RequestContext& ctx) override;
    std::string_view name() const override { return "CorsMiddleware"; }

private:
    [[nodiscard]] bool origin_allowed(std::string_view origin) const;
    [[nodiscard]] bool method_allowed(std::string_view method) const;
    [[nodiscard]] bool headers_allowed(std::string_view requested) const;
    [[nodiscard]] std::string expose_list(const http::Response& response) const;

    MiddlewareResult reject_preflight(RequestContext& ctx, std::string_view reason);

    Config config_;
    core::fast_set<std::string> paths_;
};

/// Attaches the admin request context (profile handle) to every request
class AdminContextMiddleware : public Middleware {
public:
    explicit AdminContextMiddleware(std::shared_ptr<const core::Profile> profile)
        : profile_(std::move(profile)) {}

    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "AdminContextMiddleware"; }

private:
    std::shared_ptr<const core::Profile> profile_;
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Add middleware function to pipeline
    void use(MiddlewareFunc func, std::string_view name = "CustomMiddleware");

    /// Execute request phase in registration order, stopping at the first non-Continue
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute response phase in registration order
    [[nodiscard]] MiddlewareResult execute_response(RequestContext& ctx);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    /// Middleware names in execution order
    [[nodiscard]] std::vector<std::string_view> names() const;

    /// Clear all middleware
    void clear() { middleware_.clear(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(std::unique_ptr<Middleware> middleware) {
        pipeline_.use(std::move(middleware));
        return *this;
    }

    PipelineBuilder& use(MiddlewareFunc func, std::string_view name = "CustomMiddleware") {
        pipeline_.use(std::move(func), name);
        return *this;
    }

    Pipeline build() { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

/// Function middleware wrapper
class FunctionMiddleware : public Middleware {
public:
    explicit FunctionMiddleware(MiddlewareFunc func, std::string name)
        : func_(std::move(func)), name_(std::move(name)) {}

    MiddlewareResult process_request(RequestContext& ctx) override { return func_(ctx); }

    std::string_view name() const override { return name_; }

private:
    MiddlewareFunc func_;
    std::string name_;
};

// Response helpers

/// Set status, JSON content type and serialized body
void respond_json(http::Response& response, http::StatusCode status, const nlohmann::json& body);

/// Error reply {"reason": reason}; reason also becomes the status line phrase
void respond_error(http::Response& response, http::StatusCode status, std::string_view reason);

}  // namespace vcadmin::gateway
