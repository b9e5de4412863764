#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace CL {

// Maps consumer-facing control keys to their location inside a snapshot.
class ControlMap {
public:
    ControlMap();
    explicit ControlMap(std::map<std::string, std::string, std::less<>> paths);

    [[nodiscard]] static auto defaults() -> ControlMap;

    void set(std::string key, std::string path);

    // Unmapped keys that already look like dotted paths are used verbatim.
    [[nodiscard]] auto pathFor(std::string_view key) const -> std::optional<std::string>;

    // Finds the server-confirmed value for key inside a command response's data.
    [[nodiscard]] auto confirmedValue(std::string_view key, nlohmann::json const& data) const
        -> std::optional<nlohmann::json>;

    [[nodiscard]] auto keys() const -> std::map<std::string, std::string, std::less<>> const& { return paths_; }

private:
    std::map<std::string, std::string, std::less<>> paths_;
};

} // namespace CL
