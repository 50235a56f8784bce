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

// vcadmin API Key Authentication Middleware - Implementation

#include "api_key_middleware.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "../core/logging.hpp"

namespace vcadmin::gateway {

// ApiKeyAuthenticator implementation

ApiKeyAuthenticator::ApiKeyAuthenticator(std::string api_key, std::string header)
    : api_key_(std::move(api_key)), header_(std::move(header)) {}

bool ApiKeyAuthenticator::authenticate(const http::Request& request) const {
    // Empty configured key never authenticates
    if (api_key_.empty()) {
        return false;
    }

    const http::Header* presented = request.find_header(header_);
    if (!presented) {
        return false;
    }

    return constant_time_equals(api_key_, presented->value);
}

bool ApiKeyAuthenticator::constant_time_equals(std::string_view expected,
                                               std::string_view presented) {
    unsigned char expected_digest[EVP_MAX_MD_SIZE];
    unsigned char presented_digest[EVP_MAX_MD_SIZE];
    unsigned int expected_len = 0;
    unsigned int presented_len = 0;

    if (EVP_Digest(expected.data(), expected.size(), expected_digest, &expected_len, EVP_sha256(),
                   nullptr) != 1) {
        return false;
    }
    if (EVP_Digest(presented.data(), presented.size(), presented_digest, &presented_len,
                   EVP_sha256(), nullptr) != 1) {
        return false;
    }

    // Constant-time comparison (security)
    if (expected_len != presented_len) {
        return false;
    }
    return CRYPTO_memcmp(expected_digest, presented_digest, expected_len) == 0;
}

// ApiKeyMiddleware implementation

ApiKeyMiddleware::ApiKeyMiddleware(Config config,
                                   std::shared_ptr<const Authenticator> authenticator)
    : config_(std::move(config)), authenticator_(std::move(authenticator)) {}

MiddlewareResult ApiKeyMiddleware::process_request(RequestContext& ctx) {
    if (!config_.enabled) {
        return MiddlewareResult::Continue;
    }

    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    // Preflight requests carry no credentials
    if (ctx.request->method == http::Method::OPTIONS) {
        return MiddlewareResult::Continue;
    }

    if (config_.exempt_unprotected_paths && is_unprotected_path(ctx.request->path)) {
        return MiddlewareResult::Continue;
    }

    // No strategy configured: fail closed
    if (!authenticator_ || !authenticator_->authenticate(*ctx.request)) {
        return send_401(ctx);
    }

    return MiddlewareResult::Continue;
}

bool ApiKeyMiddleware::is_unprotected_path(std::string_view path) const {
    for (const auto& exact : config_.unprotected_paths) {
        if (path == exact) {
            return true;
        }
    }
    for (const auto& prefix : config_.unprotected_prefixes) {
        if (path.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

MiddlewareResult ApiKeyMiddleware::send_401(RequestContext& ctx) const {
    respond_error(*ctx.response, http::StatusCode::Unauthorized, "Unauthorized");
    ctx.set_error("Unauthorized");

    if (auto* logger = logging::get_current_logger()) {
        LOG_WARNING(logger,
                    "Admin authentication failed: scheme={}, method={}, path={}, client_ip={}, "
                    "correlation_id={}",
                    authenticator_ ? authenticator_->scheme() : std::string_view("none"),
                    http::to_string(ctx.request->method), ctx.request->path, ctx.client_ip,
                    ctx.correlation_id);
    }

    return MiddlewareResult::Stop;
}

}  // namespace vcadmin::gateway
