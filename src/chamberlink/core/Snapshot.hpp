#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace CL {

// Full authoritative device state as delivered by one stream frame.
struct Snapshot {
    std::uint64_t                         sequence{0};
    std::chrono::steady_clock::time_point received_at{};
    std::string                           timestamp;
    std::string                           type;
    nlohmann::json                        state = nlohmann::json::object();

    // Resolves a dotted path such as "control_panel.ac_state".
    [[nodiscard]] auto valueAt(std::string_view path) const -> std::optional<nlohmann::json>;
};

// Parses an inbound frame. The returned snapshot is not sequenced yet.
[[nodiscard]] auto parseSnapshot(std::string_view frame) -> Expected<Snapshot>;

[[nodiscard]] auto lookupPath(nlohmann::json const& root, std::string_view path) -> std::optional<nlohmann::json>;

// Numbers compare with a small tolerance, everything else exactly.
[[nodiscard]] bool valuesMatch(nlohmann::json const& lhs, nlohmann::json const& rhs);

} // namespace CL
