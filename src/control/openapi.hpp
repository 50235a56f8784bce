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

// vcadmin OpenAPI Exporter - Header
// Swagger 2.0 document generated from the route table, plus the Swagger UI page

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../gateway/router.hpp"
#include "config.hpp"

namespace vcadmin::control {

class OpenApiExporter {
public:
    /// 'api_key_header' is advertised as the security scheme
    explicit OpenApiExporter(OpenApiConfig config, std::string api_key_header = "x-api-key");

    /// Document title (agent label)
    [[nodiscard]] const std::string& title() const noexcept { return config_.label; }

    /// "v<version>"
    [[nodiscard]] std::string version_string() const;

    /// Build the document from every documented route in 'router'
    [[nodiscard]] nlohmann::json build(const gateway::Router& router) const;

    /// HTML page that renders the document at the configured spec path
    [[nodiscard]] std::string swagger_html() const;

    /// Register GET doc_path and GET spec_path on 'router'
    /// The document is rebuilt per request, so routes added later still show up
    void attach(gateway::Router& router) const;

private:
    OpenApiConfig config_;
    std::string api_key_header_;
};

}  // namespace vcadmin::control
