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


// vcadmin Health Checks - Implementation

#include "health.hpp"

#include <nlohmann/json.hpp>

namespace vcadmin::control {

namespace {

void write_probe(http::Response& response, bool healthy, const char* key, std::string_view reason) {
    response.status = HealthResponse::to_http_status(healthy);
    response.set_content_type("application/json");

    nlohmann::json body;
    if (healthy) {
        body[key] = true;
    } else {
        // Reason doubles as the status line phrase
        response.reason_phrase = std::string(reason);
        body["reason"] = std::string(reason);
    }
    response.body = body.dump();
}

}  // namespace

void HealthResponse::liveness(const ServerState& state, http::Response& response) {
    write_probe(response, state.is_live(), "alive", kNotAvailable);
}

void HealthResponse::readiness(const ServerState& state, http::Response& response) {
    write_probe(response, state.is_ready(), "ready", kNotReady);
}

} // namespace vcadmin::control
