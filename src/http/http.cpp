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

// vcadmin HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace vcadmin::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

size_t Request::content_length() const noexcept {
    auto value = get_header("Content-Length", "0");
    size_t length = 0;
    std::from_chars(value.data(), value.data() + value.size(), length);
    return length;
}

std::string_view Request::body_text() const noexcept {
    if (!body_storage.empty()) {
        return body_storage;
    }
    return {reinterpret_cast<const char*>(body.data()), body.size()};
}

// Response helper methods

const std::pair<std::string, std::string>* Response::find_header(
    std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.first, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const auto* header = find_header(name);
    return header ? std::string_view(header->second) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    for (auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            hdr_value = std::string(value);
            return;
        }
    }
    add_header(name, value);
}

bool Response::remove_header(std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it, headers.end());
    return true;
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

std::string Response::serialize() const {
    std::string out;
    out.reserve(256 + body.size());

    out.append(to_string(version));
    out.push_back(' ');
    out.append(std::to_string(static_cast<uint16_t>(status)));
    out.push_back(' ');
    out.append(reason_phrase.empty() ? to_reason_phrase(status)
                                     : std::string_view(reason_phrase));
    out.append("\r\n");

    for (const auto& [name, value] : headers) {
        // Framing headers are always computed here
        if (header_name_equals(name, "Content-Length") || header_name_equals(name, "Connection")) {
            continue;
        }
        out.append(name);
        out.append(": ");
        out.append(value);
        out.append("\r\n");
    }

    out.append("Content-Length: ");
    out.append(std::to_string(body.size()));
    out.append("\r\n");
    out.append("Connection: close\r\n");
    out.append("\r\n");

    if (!head_only) {
        out.append(body);
    }
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "HTTP/1.1";
    }
    return "HTTP/1.1";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Found:
            return "Found";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Request Entity Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace vcadmin::http
