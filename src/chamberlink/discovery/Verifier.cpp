#include "discovery/Verifier.hpp"

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

namespace CL {

namespace {

using json = nlohmann::json;

auto rejection(Endpoint const& endpoint, std::string reason) -> Error {
    return Error{Error::Code::VerificationFailed, endpoint.toUrl() + ": " + std::move(reason)};
}

} // namespace

Verifier::Verifier(DiscoveryOptions const& options, std::shared_ptr<HttpClientFactory> http)
    : options_(options)
    , http_(std::move(http)) {
    try {
        versionPattern_.emplace(options_.version_pattern);
    } catch (std::regex_error const& error) {
        cl_log("Invalid version pattern '" + options_.version_pattern + "': " + error.what(), "Verifier", "ERROR");
    }
}

auto Verifier::makeClient(Endpoint const& endpoint) const -> std::unique_ptr<HttpClient> {
    return http_->create(endpoint, options_.probe_timeout);
}

auto Verifier::verify(Endpoint const& endpoint) const -> Expected<DiscoveryResult> {
    auto client = makeClient(endpoint);
    return verify(endpoint, *client);
}

auto Verifier::verify(Endpoint const& endpoint, HttpClient& client) const -> Expected<DiscoveryResult> {
    if (!versionPattern_) {
        return std::unexpected(rejection(endpoint, "version pattern unusable"));
    }

    auto health = client.get(options_.health_path);
    if (!health) {
        return std::unexpected(rejection(endpoint, describeError(health.error())));
    }
    if (!health->ok()) {
        return std::unexpected(rejection(endpoint, "health returned HTTP " + std::to_string(health->status)));
    }

    json document;
    try {
        document = json::parse(health->body);
    } catch (json::parse_error const&) {
        return std::unexpected(rejection(endpoint, "health body is not JSON"));
    }
    if (!document.is_object()) {
        return std::unexpected(rejection(endpoint, "health body is not an object"));
    }

    auto service = document.find("service");
    if (service == document.end() || !service->is_string()) {
        return std::unexpected(rejection(endpoint, "health lacks a service name"));
    }
    if (service->get<std::string>() != options_.expected_service) {
        return std::unexpected(rejection(endpoint, "unexpected service '" + service->get<std::string>() + "'"));
    }
    auto version = document.find("version");
    if (version == document.end() || !version->is_string()) {
        return std::unexpected(rejection(endpoint, "health lacks a version"));
    }
    auto version_text = version->get<std::string>();
    if (!std::regex_search(version_text, *versionPattern_)) {
        return std::unexpected(rejection(endpoint, "version '" + version_text + "' not accepted"));
    }

    for (auto const& path : options_.verify_endpoints) {
        auto reply = client.get(path);
        if (!reply) {
            return std::unexpected(rejection(endpoint, path + " unreachable: " + describeError(reply.error())));
        }
        if (reply->status == 404 || reply->status >= 500) {
            return std::unexpected(rejection(endpoint, path + " returned HTTP " + std::to_string(reply->status)));
        }
    }

    cl_log("Verified " + endpoint.toUrl() + " as " + version_text, "Verifier");
    return DiscoveryResult{endpoint, std::chrono::system_clock::now(), service->get<std::string>(), version_text};
}

} // namespace CL
