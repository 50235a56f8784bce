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

// vcadmin Admin Status Server - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "control/config.hpp"
#include "control/stats.hpp"
#include "core/admin_server.hpp"
#include "core/logging.hpp"
#include "core/profile.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_fatal_requested{false};

constexpr const char* kApiKeyEnv = "VCADMIN_API_KEY";

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    } else if (signal == SIGUSR1) {
        g_fatal_requested = true;
    }
}

/// Read the config file, applying the API key from the environment when set
std::optional<vcadmin::control::Config> load_config(const std::string& path,
                                                    vcadmin::control::ValidationResult& validation) {
    const char* env_key = std::getenv(kApiKeyEnv);
    if (!env_key || *env_key == '\0') {
        return vcadmin::control::ConfigLoader::load_from_file(path, &validation);
    }

    std::ifstream file{path};
    if (!file.is_open()) {
        validation.add_error("Cannot open configuration file '" + path + "'");
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    // Leave malformed documents to the loader so it reports the parse error
    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return vcadmin::control::ConfigLoader::load_from_json(buffer.str(), &validation);
    }
    j["admin"]["api_key"] = env_key;
    return vcadmin::control::ConfigLoader::load_from_json(j.dump(), &validation);
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("vcadmin Admin Status Server v0.1.0\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];

    printf("Loading configuration from %s...\n", config_path.c_str());
    vcadmin::control::ValidationResult validation;
    auto config = load_config(config_path, validation);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }

    vcadmin::logging::init_logging_system();
    auto* logger = vcadmin::logging::init_logger(config->logging);

    auto profile = std::make_shared<const vcadmin::core::Profile>(config->openapi.label);
    auto collector = std::make_shared<vcadmin::control::Collector>();

    vcadmin::core::AdminServer server(*config, profile, collector);

    // Install signal handlers for graceful shutdown and fatal notification
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGUSR1, signal_handler);  // Fatal error from supervising logic

    if (auto ec = server.start(); ec) {
        fprintf(stderr, "Admin server error: %s\n", ec.message().c_str());
        vcadmin::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Listening on %s:%u\n", server.host().c_str(), static_cast<unsigned>(server.port()));

    bool fatal_reported = false;
    while (!g_shutdown_requested.load()) {
        if (!fatal_reported && g_fatal_requested.load()) {
            server.notify_fatal_error();
            fatal_reported = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    printf("\nReceived shutdown signal (SIGTERM/SIGINT), stopping...\n");
    LOG_INFO(logger, "Shutdown requested");
    server.stop();

    printf("vcadmin stopped.\n");
    vcadmin::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
