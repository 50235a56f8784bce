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

// vcadmin Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace vcadmin::control {

// Security limits for the admin key and allow-list (DoS prevention)
constexpr size_t MAX_API_KEY_LENGTH = 4096;
constexpr size_t MAX_UNPROTECTED_ENTRIES = 64;
constexpr uint32_t MAX_REQUEST_SIZE_MB_LIMIT = 1024;

namespace {

/// Range checks that must run on the raw document (narrowing happens in from_json)
void validate_raw_ranges(const nlohmann::json& j, ValidationResult& result) {
    if (!j.contains("server") || !j["server"].is_object()) {
        return;
    }
    const auto& server = j["server"];
    if (server.contains("listen_port")) {
        const auto& port = server["listen_port"];
        if (!port.is_number_unsigned() || port.get<uint64_t>() > 65535) {
            result.add_error("Server listen_port must be an integer in 1..65535");
        }
    }
}

/// Allow-list entries are matched verbatim against request paths
void validate_path_list(const std::vector<std::string>& paths, std::string_view field,
                        ValidationResult& result) {
    if (paths.size() > MAX_UNPROTECTED_ENTRIES) {
        result.add_error("Admin " + std::string(field) + " has too many entries (" +
                         std::to_string(paths.size()) + " > " +
                         std::to_string(MAX_UNPROTECTED_ENTRIES) + ")");
    }
    for (const auto& path : paths) {
        if (path.empty() || path.front() != '/') {
            result.add_error("Admin " + std::string(field) + " entry '" + path +
                             "' must start with '/'");
        }
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult* validation) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        if (validation) {
            validation->add_error("Cannot open configuration file '" + path_str + "'");
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, validation);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult* validation) {
    Config config;
    ValidationResult result;

    try {
        auto j = nlohmann::json::parse(json);
        validate_raw_ranges(j, result);
        if (result.has_errors()) {
            if (validation) {
                *validation = std::move(result);
            }
            return std::nullopt;
        }
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - logging is not up yet at config load time
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        result.add_error(std::string("Invalid JSON: ") + e.what());
        if (validation) {
            *validation = std::move(result);
        }
        return std::nullopt;
    }

    result = validate(config);
    if (validation) {
        *validation = result;
    }

    if (result.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_address.empty()) {
        result.add_error("Server listen_address cannot be empty");
    }

    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.backlog == 0) {
        result.add_error("Server backlog must be > 0");
    }

    if (config.server.max_request_size_mb == 0) {
        result.add_error("Server max_request_size_mb must be > 0");
    } else if (config.server.max_request_size_mb > MAX_REQUEST_SIZE_MB_LIMIT) {
        result.add_error("Server max_request_size_mb too large (" +
                         std::to_string(config.server.max_request_size_mb) + " > " +
                         std::to_string(MAX_REQUEST_SIZE_MB_LIMIT) + ")");
    }

    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }

    if (config.server.read_timeout_ms == 0) {
        result.add_warning("Server read_timeout_ms is 0 (idle clients hold a connection slot)");
    }

    if (config.server.max_connections == 0) {
        result.add_error("Server max_connections must be > 0");
    }

    // Admin key
    if (config.admin.api_key.empty() && !config.admin.insecure_mode) {
        result.add_error("Admin api_key is required unless insecure_mode is enabled");
    }

    if (!config.admin.api_key.empty() && config.admin.insecure_mode) {
        result.add_warning("Admin api_key is ignored because insecure_mode is enabled");
    }

    if (config.admin.api_key.size() > MAX_API_KEY_LENGTH) {
        result.add_error("Admin api_key too long (" + std::to_string(config.admin.api_key.size()) +
                         " > " + std::to_string(MAX_API_KEY_LENGTH) + ")");
    }

    if (config.admin.api_key_header.empty()) {
        result.add_error("Admin api_key_header cannot be empty");
    }

    validate_path_list(config.admin.unprotected_paths, "unprotected_paths", result);
    validate_path_list(config.admin.unprotected_prefixes, "unprotected_prefixes", result);

    // CORS
    if (config.cors.enabled && config.cors.allowed_origins.empty()) {
        result.add_warning("CORS enabled with no allowed_origins (all cross-origin requests rejected)");
    }

    // Documentation
    if (config.openapi.label.empty()) {
        result.add_warning("OpenAPI label is empty");
    }

    if (config.openapi.doc_path.empty() || config.openapi.doc_path.front() != '/') {
        result.add_error("OpenAPI doc_path must start with '/'");
    }

    if (config.openapi.spec_path.empty() || config.openapi.spec_path.front() != '/') {
        result.add_error("OpenAPI spec_path must start with '/'");
    }

    // Logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.output.empty()) {
        result.add_error("Logging output cannot be empty");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace vcadmin::control
