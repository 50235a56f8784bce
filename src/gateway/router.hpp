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

// vcadmin Router - Header
// Exact-path route table with per-method handlers and API documentation metadata

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace vcadmin::gateway {

struct RequestContext;

/// Route handler (fills ctx.response)
using RouteHandler = std::function<void(RequestContext&)>;

/// OpenAPI metadata for a route
struct RouteDoc {
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    std::string schema_name;                  // Definition name for the 200 response
    nlohmann::json response_schema = nullptr;  // JSON schema of the 200 response body
};

/// Route definition
struct Route {
    std::string path;                      // Exact path (e.g., "/status/live")
    http::Method method = http::Method::GET;
    std::string handler_id;                // Unique handler identifier
    RouteHandler handler;
    bool allow_head = false;               // GET route also answers HEAD
    bool documented = true;                // Listed in the OpenAPI document
    RouteDoc doc;
};

/// Match result from router
struct RouteMatch {
    const Route* route = nullptr;
    bool path_found = false;                   // Path registered under some method
    std::vector<http::Method> allowed_methods;  // Methods registered for the path

    [[nodiscard]] bool matched() const noexcept { return route != nullptr; }

    [[nodiscard]] std::string_view handler_id() const noexcept {
        return route ? std::string_view(route->handler_id) : std::string_view{};
    }
};

/// Router
/// Routes are registered before serving starts; RouteMatch points into the table
class Router {
public:
    Router() = default;
    ~Router() = default;

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept = default;
    Router& operator=(Router&&) noexcept = default;

    /// Add a route (replaces an existing route with the same method and path)
    void add_route(Route route);

    /// Find matching route for given method and path
    [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const;

    /// True if any method is registered for 'path'
    [[nodiscard]] bool has_path(std::string_view path) const;

    /// Distinct registered paths, in registration order
    [[nodiscard]] std::vector<std::string> paths() const;

    /// Get all registered routes
    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }

    [[nodiscard]] size_t size() const noexcept { return routes_.size(); }

    /// Clear all routes
    void clear();

private:
    std::vector<Route> routes_;
    core::fast_map<std::string, std::vector<size_t>> by_path_;  // path -> indices into routes_
};

/// Route builder (fluent API)
class RouteBuilder {
public:
    explicit RouteBuilder(std::string path) { route_.path = std::move(path); }

    RouteBuilder& method(http::Method m) {
        route_.method = m;
        return *this;
    }

    RouteBuilder& handler(std::string id, RouteHandler fn) {
        route_.handler_id = std::move(id);
        route_.handler = std::move(fn);
        return *this;
    }

    RouteBuilder& allow_head(bool allow = true) {
        route_.allow_head = allow;
        return *this;
    }

    RouteBuilder& undocumented() {
        route_.documented = false;
        return *this;
    }

    RouteBuilder& summary(std::string text) {
        route_.doc.summary = std::move(text);
        return *this;
    }

    RouteBuilder& description(std::string text) {
        route_.doc.description = std::move(text);
        return *this;
    }

    RouteBuilder& tag(std::string name) {
        route_.doc.tags.push_back(std::move(name));
        return *this;
    }

    RouteBuilder& response_schema(std::string name, nlohmann::json schema) {
        route_.doc.schema_name = std::move(name);
        route_.doc.response_schema = std::move(schema);
        return *this;
    }

    Route build() { return std::move(route_); }

private:
    Route route_;
};

}  // namespace vcadmin::gateway
