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

// vcadmin Router - Implementation

#include "router.hpp"

#include <algorithm>

namespace vcadmin::gateway {

void Router::add_route(Route route) {
    auto& indices = by_path_[route.path];
    for (size_t index : indices) {
        if (routes_[index].method == route.method) {
            routes_[index] = std::move(route);
            return;
        }
    }

    indices.push_back(routes_.size());
    routes_.push_back(std::move(route));
}

RouteMatch Router::match(http::Method method, std::string_view path) const {
    RouteMatch result;

    auto it = by_path_.find(std::string(path));
    if (it == by_path_.end()) {
        return result;
    }

    result.path_found = true;
    const Route* head_fallback = nullptr;

    for (size_t index : it->second) {
        const Route& route = routes_[index];
        result.allowed_methods.push_back(route.method);
        if (route.allow_head && route.method == http::Method::GET) {
            result.allowed_methods.push_back(http::Method::HEAD);
        }

        if (route.method == method) {
            result.route = &route;
        } else if (method == http::Method::HEAD && route.method == http::Method::GET &&
                   route.allow_head) {
            head_fallback = &route;
        }
    }

    // Explicit HEAD route wins over the GET fallback
    if (!result.route) {
        result.route = head_fallback;
    }

    return result;
}

bool Router::has_path(std::string_view path) const {
    return by_path_.contains(std::string(path));
}

std::vector<std::string> Router::paths() const {
    std::vector<std::string> result;
    for (const auto& route : routes_) {
        if (std::find(result.begin(), result.end(), route.path) == result.end()) {
            result.push_back(route.path);
        }
    }
    return result;
}

void Router::clear() {
    routes_.clear();
    by_path_.clear();
}

}  // namespace vcadmin::gateway
