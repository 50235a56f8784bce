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

// vcadmin Timing Collector - Implementation

#include "stats.hpp"

#include <algorithm>

namespace vcadmin::control {

void Collector::record(std::string_view label, std::chrono::nanoseconds elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return;
    }

    auto& stats = timings_[std::string(label)];
    stats.count++;
    stats.total += elapsed;
    stats.min = std::min(stats.min, elapsed);
    stats.max = std::max(stats.max, elapsed);
}

void Collector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    timings_.clear();
}

void Collector::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool Collector::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

std::optional<TimingStats> Collector::get(std::string_view label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timings_.find(std::string(label));
    if (it == timings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, TimingStats>> Collector::snapshot() const {
    std::vector<std::pair<std::string, TimingStats>> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.assign(timings_.begin(), timings_.end());
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

size_t Collector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timings_.size();
}

}  // namespace vcadmin::control
