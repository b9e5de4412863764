#include "core/Types.hpp"

#include <charconv>
#include <string>

namespace CL {

auto Endpoint::toUrl() const -> std::string {
    std::string url;
    url.reserve(scheme.size() + host.size() + 10);
    url.append(scheme);
    url.append("://");
    url.append(host);
    url.push_back(':');
    url.append(std::to_string(port));
    return url;
}

auto Endpoint::key() const -> std::string {
    return host + ":" + std::to_string(port);
}

bool Endpoint::secure() const {
    return scheme == "https";
}

auto toString(ConnectionState state) -> std::string_view {
    switch (state) {
    case ConnectionState::Idle:
        return "idle";
    case ConnectionState::Discovering:
        return "discovering";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Disconnected:
        return "disconnected";
    }
    return "unknown";
}

auto defaultPortForScheme(std::string_view scheme) -> std::uint16_t {
    if (scheme == "https" || scheme == "wss") {
        return 443;
    }
    return 80;
}

auto parseEndpointUrl(std::string_view url) -> Expected<Endpoint> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "missing scheme in " + std::string{url}});
    }
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https" && scheme != "ws" && scheme != "wss") {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "unsupported scheme " + std::string{scheme}});
    }

    Endpoint endpoint;
    endpoint.scheme = (scheme == "https" || scheme == "wss") ? "https" : "http";
    endpoint.port   = defaultPortForScheme(scheme);

    auto remainder  = url.substr(scheme_end + 3);
    auto path_start = remainder.find('/');
    auto authority  = remainder.substr(0, path_start);
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "missing host in " + std::string{url}});
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_text = authority.substr(colon + 1);
        int  parsed    = 0;
        auto result    = std::from_chars(port_text.data(), port_text.data() + port_text.size(), parsed);
        if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size() || parsed <= 0
            || parsed > 65535) {
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "invalid port in " + std::string{url}});
        }
        endpoint.port = static_cast<std::uint16_t>(parsed);
        authority     = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "missing host in " + std::string{url}});
    }
    endpoint.host = std::string{authority};
    return endpoint;
}

} // namespace CL
