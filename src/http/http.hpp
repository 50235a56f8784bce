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

// vcadmin HTTP Protocol - Header
// Request views into the connection buffer, owned response

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vcadmin::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes used by the admin surface
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,

    // 3xx Redirection
    Found = 302,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,

    // 5xx Server Error
    InternalServerError = 500,
    ServiceUnavailable = 503,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request (views into the connection buffer)
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;

    // Body view into buffer; chunked bodies are copied into body_storage instead
    std::span<const uint8_t> body;
    std::string body_storage;

    // Helper: Body bytes regardless of where they are stored
    [[nodiscard]] std::string_view body_text() const noexcept;

    [[nodiscard]] size_t body_size() const noexcept { return body_text().size(); }

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Content-Length helper
    [[nodiscard]] size_t content_length() const noexcept;
};

/// HTTP response (owns all of its storage)
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    // Overrides the standard reason phrase when non-empty
    std::string reason_phrase;

    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Suppress the body on the wire (HEAD requests) but keep Content-Length
    bool head_only = false;

    [[nodiscard]] const std::pair<std::string, std::string>* find_header(
        std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Append header (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Replace header value, adding it when missing
    void set_header(std::string_view name, std::string_view value);

    // Returns true if header was found and removed
    bool remove_header(std::string_view name);

    void set_content_type(std::string_view content_type);

    /// Serialize status line, headers and body (adds Content-Length and Connection: close)
    [[nodiscard]] std::string serialize() const;
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace vcadmin::http
