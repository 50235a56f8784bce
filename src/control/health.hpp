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


// vcadmin Health Checks - Header
// Liveness/readiness flags and probe response building

#pragma once

#include <atomic>
#include <string_view>

#include "../http/http.hpp"

namespace vcadmin::control {

/// Process-wide (alive, ready) pair
/// ready implies alive only at read time: is_ready() ANDs both flags,
/// inconsistent writes such as (F,T) are allowed
class ServerState {
public:
    ServerState() = default;

    // Non-copyable, non-movable
    ServerState(const ServerState&) = delete;
    ServerState& operator=(const ServerState&) = delete;

    void set_alive(bool alive) noexcept { alive_.store(alive, std::memory_order_release); }

    void set_ready(bool ready) noexcept { ready_.store(ready, std::memory_order_release); }

    /// Listener bound and accepting
    [[nodiscard]] bool is_live() const noexcept {
        return alive_.load(std::memory_order_acquire);
    }

    /// Live and willing to serve business traffic
    [[nodiscard]] bool is_ready() const noexcept {
        return ready_.load(std::memory_order_acquire) && alive_.load(std::memory_order_acquire);
    }

    /// Raw ready flag, without the alive conjunction
    [[nodiscard]] bool ready_flag() const noexcept {
        return ready_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> alive_{false};
    std::atomic<bool> ready_{false};
};

/// Probe response builder
class HealthResponse {
public:
    static constexpr std::string_view kNotAvailable = "Service not available";
    static constexpr std::string_view kNotReady = "Service not ready";

    /// 200 {"alive": true} or 503 {"reason": "Service not available"}
    static void liveness(const ServerState& state, http::Response& response);

    /// 200 {"ready": true} or 503 {"reason": "Service not ready"}
    static void readiness(const ServerState& state, http::Response& response);

    /// Determine HTTP status code for a probe outcome
    [[nodiscard]] static http::StatusCode to_http_status(bool healthy) noexcept {
        return healthy ? http::StatusCode::OK : http::StatusCode::ServiceUnavailable;
    }
};

} // namespace vcadmin::control
