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

// vcadmin Pipeline - Implementation

#include "pipeline.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>

#include "../control/stats.hpp"
#include "../core/logging.hpp"

namespace vcadmin::gateway {

namespace {

constexpr std::string_view kPreflightKey = "cors_preflight";

// Always visible to scripts, never listed in Access-Control-Expose-Headers
constexpr std::array<std::string_view, 6> kSimpleResponseHeaders = {
    "Cache-Control", "Content-Language", "Content-Type", "Expires", "Last-Modified", "Pragma"};

bool contains_wildcard(const std::vector<std::string>& values) {
    return std::find(values.begin(), values.end(), "*") != values.end();
}

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += values[i];
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

}  // namespace

// LoggingMiddleware implementation (Response phase - logs with timing)

MiddlewareResult LoggingMiddleware::process_response(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto elapsed = std::chrono::steady_clock::now() - ctx.start_time;
    auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();

    if (ctx.collector && ctx.route_match.matched() &&
        ctx.request->method != http::Method::OPTIONS) {
        ctx.collector->record(
            fmt::format("{} {}", http::to_string(ctx.request->method), ctx.request->path),
            std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed));
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_REQUEST(logger, http::to_string(ctx.request->method), ctx.request->path,
                    static_cast<int>(ctx.response->status), duration_us, ctx.client_ip,
                    ctx.correlation_id);
    }

    return MiddlewareResult::Continue;
}

// CorsMiddleware implementation

void CorsMiddleware::enable_for(const Router& router) {
    for (const auto& route : router.routes()) {
        paths_.insert(route.path);
    }
}

void CorsMiddleware::enable_path(std::string path) {
    paths_.insert(std::move(path));
}

bool CorsMiddleware::is_enabled_for(std::string_view path) const {
    return paths_.contains(std::string(path));
}

bool CorsMiddleware::origin_allowed(std::string_view origin) const {
    for (const auto& allowed : config_.allowed_origins) {
        // Exact match (case-sensitive per RFC 6454)
        if (allowed == "*" || origin == allowed) {
            return true;
        }
    }
    return false;
}

bool CorsMiddleware::method_allowed(std::string_view method) const {
    for (const auto& allowed : config_.allowed_methods) {
        if (allowed == "*" || method == allowed) {
            return true;
        }
    }
    return false;
}

bool CorsMiddleware::headers_allowed(std::string_view requested) const {
    if (contains_wildcard(config_.allowed_headers)) {
        return true;
    }

    while (!requested.empty()) {
        size_t comma = requested.find(',');
        std::string_view name = trim(requested.substr(0, comma));
        requested = (comma == std::string_view::npos) ? std::string_view{}
                                                      : requested.substr(comma + 1);
        if (name.empty()) {
            continue;
        }

        bool found = std::any_of(
            config_.allowed_headers.begin(), config_.allowed_headers.end(),
            [name](const std::string& allowed) { return http::header_name_equals(allowed, name); });
        if (!found) {
            return false;
        }
    }
    return true;
}

std::string CorsMiddleware::expose_list(const http::Response& response) const {
    if (!contains_wildcard(config_.expose_headers)) {
        return join(config_.expose_headers);
    }

    // Wildcard expands to the non-simple headers actually sent
    std::vector<std::string> names{"Content-Length"};
    for (const auto& [name, value] : response.headers) {
        (void)value;
        bool simple = std::any_of(
            kSimpleResponseHeaders.begin(), kSimpleResponseHeaders.end(),
            [&name](std::string_view s) { return http::header_name_equals(s, name); });
        bool cors = name.size() >= 15 &&
                    http::header_name_equals(std::string_view(name).substr(0, 15), "Access-Control-");
        if (simple || cors) {
            continue;
        }
        bool seen = std::any_of(names.begin(), names.end(), [&name](const std::string& n) {
            return http::header_name_equals(n, name);
        });
        if (!seen) {
            names.push_back(name);
        }
    }
    return join(names);
}

MiddlewareResult CorsMiddleware::reject_preflight(RequestContext& ctx, std::string_view reason) {
    respond_error(*ctx.response, http::StatusCode::Forbidden, "CORS preflight request failed");
    ctx.set_error(std::string(reason));

    if (auto* logger = logging::get_current_logger()) {
        LOG_WARNING(logger, "CORS preflight rejected: path={}, reason={}, client_ip={}",
                    ctx.request->path, reason, ctx.client_ip);
    }
    return MiddlewareResult::Stop;
}

// Request phase - answers preflight requests

MiddlewareResult CorsMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    if (!config_.enabled || ctx.request->method != http::Method::OPTIONS) {
        return MiddlewareResult::Continue;
    }

    ctx.set_metadata(std::string(kPreflightKey), "1");

    if (!is_enabled_for(ctx.request->path)) {
        return reject_preflight(ctx, "CORS is not enabled for this resource");
    }

    std::string_view origin = ctx.request->get_header("Origin");
    if (origin.empty()) {
        return reject_preflight(ctx, "Origin header is not specified in the request");
    }

    std::string_view requested_method = ctx.request->get_header("Access-Control-Request-Method");
    if (requested_method.empty()) {
        return reject_preflight(ctx, "Access-Control-Request-Method header is not specified");
    }

    if (!origin_allowed(origin)) {
        return reject_preflight(ctx, "origin is not allowed");
    }

    if (!method_allowed(requested_method)) {
        return reject_preflight(ctx, "request method is not allowed");
    }

    std::string_view requested_headers =
        ctx.request->get_header("Access-Control-Request-Headers");
    if (!headers_allowed(requested_headers)) {
        return reject_preflight(ctx, "request headers are not allowed");
    }

    auto& response = *ctx.response;
    response.status = http::StatusCode::OK;
    response.body.clear();

    if (config_.allow_credentials || !contains_wildcard(config_.allowed_origins)) {
        response.set_header("Access-Control-Allow-Origin", origin);
        response.add_header("Vary", "Origin");
    } else {
        response.set_header("Access-Control-Allow-Origin", "*");
    }

    if (config_.allow_credentials) {
        response.set_header("Access-Control-Allow-Credentials", "true");
    }

    response.set_header("Access-Control-Allow-Methods", requested_method);
    if (!requested_headers.empty()) {
        response.set_header("Access-Control-Allow-Headers", requested_headers);
    }
    response.set_header("Access-Control-Max-Age", std::to_string(config_.max_age));

    return MiddlewareResult::Stop;
}

// Response phase - decorates actual (non-preflight) responses

MiddlewareResult CorsMiddleware::process_response(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    if (!config_.enabled || !ctx.get_metadata(kPreflightKey).empty()) {
        return MiddlewareResult::Continue;
    }

    std::string_view origin = ctx.request->get_header("Origin");
    if (origin.empty() || !is_enabled_for(ctx.request->path) || !origin_allowed(origin)) {
        return MiddlewareResult::Continue;
    }

    auto& response = *ctx.response;
    // Listed before the CORS headers below are added
    std::string exposed = expose_list(response);

    if (config_.allow_credentials || !contains_wildcard(config_.allowed_origins)) {
        response.set_header("Access-Control-Allow-Origin", origin);
        response.add_header("Vary", "Origin");
    } else {
        response.set_header("Access-Control-Allow-Origin", "*");
    }

    if (config_.allow_credentials) {
        response.set_header("Access-Control-Allow-Credentials", "true");
    }

    if (!exposed.empty()) {
        response.set_header("Access-Control-Expose-Headers", exposed);
    }

    return MiddlewareResult::Continue;
}

// AdminContextMiddleware implementation (Request phase - attaches profile)

MiddlewareResult AdminContextMiddleware::process_request(RequestContext& ctx) {
    ctx.admin_context = core::AdminRequestContext{profile_};
    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    middleware_.push_back(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            if (ctx.error_message.empty()) {
                ctx.set_error(fmt::format("{} failed", middleware->name()));
            }
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_response(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            if (ctx.error_message.empty()) {
                ctx.set_error(fmt::format("{} failed", middleware->name()));
            }
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

std::vector<std::string_view> Pipeline::names() const {
    std::vector<std::string_view> result;
    result.reserve(middleware_.size());
    for (const auto& middleware : middleware_) {
        result.push_back(middleware->name());
    }
    return result;
}

// Response helpers

void respond_json(http::Response& response, http::StatusCode status, const nlohmann::json& body) {
    response.status = status;
    response.set_content_type("application/json");
    response.body = body.dump();
}

void respond_error(http::Response& response, http::StatusCode status, std::string_view reason) {
    response.reason_phrase = std::string(reason);
    respond_json(response, status, nlohmann::json{{"reason", std::string(reason)}});
}

}  // namespace vcadmin::gateway
