#include "core/ControlMap.hpp"

#include "core/Snapshot.hpp"

namespace CL {

ControlMap::ControlMap() = default;

ControlMap::ControlMap(std::map<std::string, std::string, std::less<>> paths)
    : paths_(std::move(paths)) {}

auto ControlMap::defaults() -> ControlMap {
    return ControlMap{{
        {"ceiling_lights", "control_panel.ceiling_lights_state"},
        {"reading_lights", "control_panel.reading_lights_state"},
        {"door_lights", "control_panel.door_lights_state"},
        {"ac", "control_panel.ac_state"},
        {"intercom", "control_panel.intercom_state"},
        {"pressure_setpoint", "pressure.setpoint"},
        {"session_running", "session.running_state"},
    }};
}

void ControlMap::set(std::string key, std::string path) {
    paths_[std::move(key)] = std::move(path);
}

auto ControlMap::pathFor(std::string_view key) const -> std::optional<std::string> {
    if (auto it = paths_.find(key); it != paths_.end()) {
        return it->second;
    }
    if (key.find('.') != std::string_view::npos) {
        return std::string{key};
    }
    return std::nullopt;
}

auto ControlMap::confirmedValue(std::string_view key, nlohmann::json const& data) const
    -> std::optional<nlohmann::json> {
    if (!data.is_object()) {
        return std::nullopt;
    }
    if (auto it = data.find(std::string{key}); it != data.end()) {
        return *it;
    }
    auto path = pathFor(key);
    if (!path) {
        return std::nullopt;
    }
    if (auto nested = lookupPath(data, *path)) {
        return nested;
    }
    auto leaf = std::string_view{*path};
    if (auto dot = leaf.rfind('.'); dot != std::string_view::npos) {
        leaf.remove_prefix(dot + 1);
    }
    if (auto it = data.find(std::string{leaf}); it != data.end()) {
        return *it;
    }
    return std::nullopt;
}

} // namespace CL
