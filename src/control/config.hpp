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

// vcadmin Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vcadmin::control {

/// Listener settings
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8081;
    uint32_t backlog = 128;

    // Deadline for a whole request to arrive, from accept (milliseconds, 0 = none)
    uint32_t read_timeout_ms = 30000;

    // Connections served at once (one worker thread each)
    uint32_t max_connections = 64;

    // Limits
    uint32_t max_request_size_mb = 1;  // Body limit, in MiB
    uint32_t max_header_size = 8192;   // 8KB
};

/// Admin API key settings
struct AdminConfig {
    std::string api_key;
    std::string api_key_header = "x-api-key";

    // Skip the key check entirely (explicit opt-in)
    bool insecure_mode = false;

    // Honor the unprotected-path allow-list below
    bool exempt_unprotected_paths = false;

    std::vector<std::string> unprotected_paths = {"/api/doc", "/api/docs/swagger.json",
                                                  "/favicon.ico", "/status/live",
                                                  "/status/ready"};
    std::vector<std::string> unprotected_prefixes = {"/static/swagger/"};
};

/// CORS settings (applied to every registered route)
struct CorsConfig {
    bool enabled = true;
    std::vector<std::string> allowed_origins = {"*"};
    std::vector<std::string> allowed_methods = {"*"};
    std::vector<std::string> allowed_headers = {"*"};
    std::vector<std::string> expose_headers = {"*"};
    bool allow_credentials = true;
    uint32_t max_age = 86400;
};

/// API documentation settings
struct OpenApiConfig {
    std::string label = "vcadmin";   // Agent label, used as document title
    std::string version = "11";      // Rendered as "v<version>"
    std::string doc_path = "/api/doc";
    std::string spec_path = "/api/docs/swagger.json";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";             // debug, info, warning, error
    std::string format = "text";            // json, text
    std::string output = "stdout";          // "stdout" or a log directory (admin.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full vcadmin configuration
struct Config {
    ServerConfig server;
    AdminConfig admin;
    CorsConfig cors;
    OpenApiConfig openapi;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// Custom from_json/to_json so partial configs fall back to defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8081));
    s.backlog = j.value("backlog", 128u);
    s.read_timeout_ms = j.value("read_timeout_ms", 30000u);
    s.max_connections = j.value("max_connections", 64u);
    s.max_request_size_mb = j.value("max_request_size_mb", 1u);
    s.max_header_size = j.value("max_header_size", 8192u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"read_timeout_ms", s.read_timeout_ms},
                       {"max_connections", s.max_connections},
                       {"max_request_size_mb", s.max_request_size_mb},
                       {"max_header_size", s.max_header_size}};
}

inline void from_json(const nlohmann::json& j, AdminConfig& a) {
    AdminConfig defaults;
    a.api_key = j.value("api_key", std::string());
    a.api_key_header = j.value("api_key_header", defaults.api_key_header);
    a.insecure_mode = j.value("insecure_mode", false);
    a.exempt_unprotected_paths = j.value("exempt_unprotected_paths", false);
    a.unprotected_paths = j.value("unprotected_paths", defaults.unprotected_paths);
    a.unprotected_prefixes = j.value("unprotected_prefixes", defaults.unprotected_prefixes);
}

// The key itself is never written back out
inline void to_json(nlohmann::json& j, const AdminConfig& a) {
    j = nlohmann::json{{"api_key_header", a.api_key_header},
                       {"insecure_mode", a.insecure_mode},
                       {"exempt_unprotected_paths", a.exempt_unprotected_paths},
                       {"unprotected_paths", a.unprotected_paths},
                       {"unprotected_prefixes", a.unprotected_prefixes}};
}

inline void from_json(const nlohmann::json& j, CorsConfig& c) {
    CorsConfig defaults;
    c.enabled = j.value("enabled", true);
    c.allowed_origins = j.value("allowed_origins", defaults.allowed_origins);
    c.allowed_methods = j.value("allowed_methods", defaults.allowed_methods);
    c.allowed_headers = j.value("allowed_headers", defaults.allowed_headers);
    c.expose_headers = j.value("expose_headers", defaults.expose_headers);
    c.allow_credentials = j.value("allow_credentials", true);
    c.max_age = j.value("max_age", 86400u);
}

inline void to_json(nlohmann::json& j, const CorsConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"allowed_origins", c.allowed_origins},
                       {"allowed_methods", c.allowed_methods},
                       {"allowed_headers", c.allowed_headers},
                       {"expose_headers", c.expose_headers},
                       {"allow_credentials", c.allow_credentials},
                       {"max_age", c.max_age}};
}

inline void from_json(const nlohmann::json& j, OpenApiConfig& o) {
    OpenApiConfig defaults;
    o.label = j.value("label", defaults.label);
    o.version = j.value("version", defaults.version);
    o.doc_path = j.value("doc_path", defaults.doc_path);
    o.spec_path = j.value("spec_path", defaults.spec_path);
}

inline void to_json(nlohmann::json& j, const OpenApiConfig& o) {
    j = nlohmann::json{{"label", o.label},
                       {"version", o.version},
                       {"doc_path", o.doc_path},
                       {"spec_path", o.spec_path}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    // Use contains() for custom struct types to avoid infinite recursion
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("admin")) {
        j.at("admin").get_to(c.admin);
    }
    if (j.contains("cors")) {
        j.at("cors").get_to(c.cors);
    }
    if (j.contains("openapi")) {
        j.at("openapi").get_to(c.openapi);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j["description"].is_string()) {
        c.description = j["description"].get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["server"] = c.server;
    j["admin"] = c.admin;
    j["cors"] = c.cors;
    j["openapi"] = c.openapi;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult* validation = nullptr);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult* validation = nullptr);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace vcadmin::control
