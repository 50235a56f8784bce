// vcadmin Profile - Header
// Host-owned profile handle, attached read-only to every admin request

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace vcadmin::core {

/// Named settings bag owned by the host application
class Profile {
public:
    explicit Profile(std::string name, nlohmann::json settings = nlohmann::json::object())
        : name_(std::move(name)), settings_(std::move(settings)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const nlohmann::json& settings() const noexcept { return settings_; }

    /// Setting by key, or 'fallback' when absent or of another type
    template <typename T>
    [[nodiscard]] T setting(std::string_view key, T fallback) const {
        auto it = settings_.find(std::string(key));
        if (it == settings_.end()) {
            return fallback;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

private:
    std::string name_;
    nlohmann::json settings_;
};

/// Per-request admin context (carries the profile to handlers)
struct AdminRequestContext {
    std::shared_ptr<const Profile> profile;

    [[nodiscard]] bool has_profile() const noexcept { return profile != nullptr; }
};

}  // namespace vcadmin::core
