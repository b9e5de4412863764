#pragma once

#include <chamberlink/ClientOptions.hpp>

#include "core/Types.hpp"
#include "transport/HttpTransport.hpp"

#include <memory>
#include <optional>
#include <regex>

namespace CL {

// Confirms that an endpoint hosts the expected backend rather than any HTTP
// service on the same port. Every failure is reported as VerificationFailed.
class Verifier {
public:
    Verifier(DiscoveryOptions const& options, std::shared_ptr<HttpClientFactory> http);

    [[nodiscard]] auto verify(Endpoint const& endpoint) const -> Expected<DiscoveryResult>;
    // Runs the checks through a caller-owned client so the caller can cancel them.
    [[nodiscard]] auto verify(Endpoint const& endpoint, HttpClient& client) const -> Expected<DiscoveryResult>;

    [[nodiscard]] auto makeClient(Endpoint const& endpoint) const -> std::unique_ptr<HttpClient>;

private:
    DiscoveryOptions                   options_;
    std::shared_ptr<HttpClientFactory> http_;
    std::optional<std::regex>          versionPattern_;
};

} // namespace CL
