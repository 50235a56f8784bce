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

// vcadmin API Key Authentication Middleware - Header

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pipeline.hpp"

namespace vcadmin::gateway {

/// Credential check strategy (injectable for alternate schemes)
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /// True if the request carries a valid admin credential
    [[nodiscard]] virtual bool authenticate(const http::Request& request) const = 0;

    /// Scheme name reported in logs
    [[nodiscard]] virtual std::string_view scheme() const = 0;
};

/// Single shared API key compared in constant time
class ApiKeyAuthenticator : public Authenticator {
public:
    explicit ApiKeyAuthenticator(std::string api_key, std::string header = "x-api-key");

    [[nodiscard]] bool authenticate(const http::Request& request) const override;

    [[nodiscard]] std::string_view scheme() const override { return "api-key"; }

    [[nodiscard]] const std::string& header() const noexcept { return header_; }

    /// Compares SHA-256 digests with CRYPTO_memcmp so neither length nor
    /// matching prefix of 'expected' is observable through timing
    [[nodiscard]] static bool constant_time_equals(std::string_view expected,
                                                   std::string_view presented);

private:
    std::string api_key_;
    std::string header_;
};

/// API key authentication middleware (Request phase)
class ApiKeyMiddleware : public Middleware {
public:
    struct Config {
        bool enabled = true;
        // Honor the allow-list below (off: every non-OPTIONS request needs the key)
        bool exempt_unprotected_paths = false;
        std::vector<std::string> unprotected_paths;
        std::vector<std::string> unprotected_prefixes;
    };

    ApiKeyMiddleware(Config config, std::shared_ptr<const Authenticator> authenticator);
    ~ApiKeyMiddleware() override = default;

    /// Process request phase (validate credential)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "ApiKeyMiddleware"; }

    /// Exact path or prefix match against the configured allow-list
    [[nodiscard]] bool is_unprotected_path(std::string_view path) const;

private:
    /// Send 401 Unauthorized response
    [[nodiscard]] MiddlewareResult send_401(RequestContext& ctx) const;

    Config config_;
    std::shared_ptr<const Authenticator> authenticator_;
};

}  // namespace vcadmin::gateway
