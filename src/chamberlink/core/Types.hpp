#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace CL {

// One network location. Immutable once built.
struct Endpoint {
    std::string   scheme{"http"};
    std::string   host;
    std::uint16_t port{0};

    [[nodiscard]] auto toUrl() const -> std::string;
    [[nodiscard]] auto key() const -> std::string;
    [[nodiscard]] bool secure() const;

    friend bool operator==(Endpoint const&, Endpoint const&) = default;
};

struct DiscoveryResult {
    Endpoint                              endpoint;
    std::chrono::system_clock::time_point verified_at{};
    std::string                           service_name;
    std::string                           service_version;
};

enum class ConnectionState {
    Idle,
    Discovering,
    Connected,
    Disconnected
};

[[nodiscard]] auto toString(ConnectionState state) -> std::string_view;

[[nodiscard]] auto defaultPortForScheme(std::string_view scheme) -> std::uint16_t;

// Accepts http, https, ws and wss URLs. Any path component is ignored; ws/wss
// map to http/https so the endpoint can serve both the REST and stream surfaces.
[[nodiscard]] auto parseEndpointUrl(std::string_view url) -> Expected<Endpoint>;

} // namespace CL
