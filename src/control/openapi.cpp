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

// vcadmin OpenAPI Exporter - Implementation

#include "openapi.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "../gateway/pipeline.hpp"

namespace vcadmin::control {

namespace {

constexpr const char* kSecurityScheme = "AuthorizationHeader";

std::string lower_method(http::Method method) {
    std::string out{http::to_string(method)};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Label and paths end up inside the HTML page
std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

}  // namespace

OpenApiExporter::OpenApiExporter(OpenApiConfig config, std::string api_key_header)
    : config_(std::move(config)), api_key_header_(std::move(api_key_header)) {}

std::string OpenApiExporter::version_string() const {
    return "v" + config_.version;
}

nlohmann::json OpenApiExporter::build(const gateway::Router& router) const {
    nlohmann::json doc;
    doc["swagger"] = "2.0";
    doc["info"] = {{"title", config_.label}, {"version", version_string()}};
    doc["securityDefinitions"] = {
        {kSecurityScheme, {{"type", "apiKey"}, {"in", "header"}, {"name", api_key_header_}}}};
    nlohmann::json requirement;
    requirement[kSecurityScheme] = nlohmann::json::array();
    doc["security"] = nlohmann::json::array({requirement});

    nlohmann::json paths = nlohmann::json::object();
    nlohmann::json definitions = nlohmann::json::object();
    std::vector<std::string> tag_names;

    for (const auto& route : router.routes()) {
        if (!route.documented) {
            continue;
        }

        nlohmann::json operation;
        if (!route.doc.tags.empty()) {
            operation["tags"] = route.doc.tags;
            for (const auto& tag : route.doc.tags) {
                if (std::find(tag_names.begin(), tag_names.end(), tag) == tag_names.end()) {
                    tag_names.push_back(tag);
                }
            }
        }
        if (!route.doc.summary.empty()) {
            operation["summary"] = route.doc.summary;
        }
        if (!route.doc.description.empty()) {
            operation["description"] = route.doc.description;
        }
        operation["produces"] = nlohmann::json::array({"application/json"});

        nlohmann::json ok = {{"description", ""}};
        if (!route.doc.schema_name.empty() && !route.doc.response_schema.is_null()) {
            definitions[route.doc.schema_name] = route.doc.response_schema;
            ok["schema"] = {{"$ref", "#/definitions/" + route.doc.schema_name}};
        }
        operation["responses"] = {{"200", std::move(ok)}};

        paths[route.path][lower_method(route.method)] = std::move(operation);
    }

    doc["paths"] = std::move(paths);
    if (!definitions.empty()) {
        doc["definitions"] = std::move(definitions);
    }
    if (!tag_names.empty()) {
        nlohmann::json tags = nlohmann::json::array();
        for (const auto& name : tag_names) {
            tags.push_back({{"name", name}});
        }
        doc["tags"] = std::move(tags);
    }

    return doc;
}

std::string OpenApiExporter::swagger_html() const {
    // Swagger UI assets load from CDN
    return fmt::format(R"(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <title>{0} {1}</title>
  <link rel="stylesheet" href="https://unpkg.com/swagger-ui-dist@5/swagger-ui.css">
</head>
<body>
  <div id="swagger-ui"></div>
  <script src="https://unpkg.com/swagger-ui-dist@5/swagger-ui-bundle.js"></script>
  <script>
    window.onload = function() {{
      window.ui = SwaggerUIBundle({{
        url: "{2}",
        dom_id: "#swagger-ui",
        deepLinking: true
      }});
    }};
  </script>
</body>
</html>
)",
                       html_escape(config_.label), html_escape(version_string()),
                       html_escape(config_.spec_path));
}

void OpenApiExporter::attach(gateway::Router& router) const {
    const gateway::Router* routes = &router;
    OpenApiExporter exporter = *this;

    router.add_route(gateway::RouteBuilder(config_.doc_path)
                         .method(http::Method::GET)
                         .handler("api_doc",
                                  [exporter](gateway::RequestContext& ctx) {
                                      ctx.response->status = http::StatusCode::OK;
                                      ctx.response->set_content_type("text/html; charset=utf-8");
                                      ctx.response->body = exporter.swagger_html();
                                  })
                         .undocumented()
                         .build());

    router.add_route(gateway::RouteBuilder(config_.spec_path)
                         .method(http::Method::GET)
                         .handler("api_spec",
                                  [exporter, routes](gateway::RequestContext& ctx) {
                                      gateway::respond_json(*ctx.response, http::StatusCode::OK,
                                                            exporter.build(*routes));
                                  })
                         .undocumented()
                         .build());
}

}  // namespace vcadmin::control
