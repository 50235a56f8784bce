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

// vcadmin Timing Collector - Header
// Thread-safe timing accumulator, cleared by POST /status/reset

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/containers.hpp"

namespace vcadmin::control {

/// Accumulated timings for one label
struct TimingStats {
    uint64_t count = 0;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    [[nodiscard]] std::chrono::nanoseconds average() const noexcept {
        return count == 0 ? std::chrono::nanoseconds{0}
                          : std::chrono::nanoseconds{total.count() / static_cast<int64_t>(count)};
    }
};

/// Performance collector
/// record() and reset() may race with each other from any thread
class Collector {
public:
    Collector() = default;

    // Non-copyable, non-movable (shared by reference between host and server)
    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    /// Add one sample under 'label' (no-op when disabled)
    void record(std::string_view label, std::chrono::nanoseconds elapsed);

    /// Drop all accumulated samples
    void reset();

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const;

    /// Stats for one label, if any sample was recorded since the last reset
    [[nodiscard]] std::optional<TimingStats> get(std::string_view label) const;

    /// All labels sorted by name
    [[nodiscard]] std::vector<std::pair<std::string, TimingStats>> snapshot() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    core::fast_map<std::string, TimingStats> timings_;
    bool enabled_ = true;
};

/// RAII timer that records its lifetime into a collector
class ScopedTimer {
public:
    ScopedTimer(Collector* collector, std::string label)
        : collector_(collector),
          label_(std::move(label)),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        if (collector_) {
            collector_->record(label_, std::chrono::steady_clock::now() - start_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Collector* collector_;
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace vcadmin::control
