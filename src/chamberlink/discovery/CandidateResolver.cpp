#include "discovery/CandidateResolver.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace CL {

auto toString(CandidatePhase phase) -> std::string_view {
    switch (phase) {
    case CandidatePhase::Override:
        return "override";
    case CandidatePhase::LastKnown:
        return "last-known";
    case CandidatePhase::Quick:
        return "quick";
    case CandidatePhase::Full:
        return "full";
    }
    return "unknown";
}

CandidateSequence::CandidateSequence(DiscoveryOptions const& options, std::optional<Endpoint> override_endpoint,
                                     std::optional<Endpoint> last_known)
    : options_(options)
    , override_(std::move(override_endpoint))
    , lastKnown_(std::move(last_known)) {
    host_ = options_.scan_range_start;
}

auto CandidateSequence::makeEndpoint(std::string const& subnet, int host) const -> Endpoint {
    Endpoint endpoint;
    endpoint.scheme = options_.scheme;
    endpoint.host   = subnet + "." + std::to_string(host);
    endpoint.port   = static_cast<std::uint16_t>(options_.backend_port);
    return endpoint;
}

auto CandidateSequence::generate() -> std::optional<Candidate> {
    while (true) {
        switch (phase_) {
        case CandidatePhase::Override:
            if (override_) {
                if (produced_ > 0) {
                    return std::nullopt;
                }
                return Candidate{*override_, CandidatePhase::Override, 0};
            }
            phase_ = CandidatePhase::LastKnown;
            break;
        case CandidatePhase::LastKnown:
            phase_ = CandidatePhase::Quick;
            if (lastKnown_) {
                return Candidate{*lastKnown_, CandidatePhase::LastKnown, 0};
            }
            break;
        case CandidatePhase::Quick:
            if (subnetIndex_ < options_.subnets.size()) {
                auto const& subnet = options_.subnets[subnetIndex_++];
                return Candidate{makeEndpoint(subnet, options_.quick_scan_host), CandidatePhase::Quick, 0};
            }
            if (!options_.full_scan) {
                return std::nullopt;
            }
            phase_       = CandidatePhase::Full;
            subnetIndex_ = 0;
            host_        = options_.scan_range_start;
            break;
        case CandidatePhase::Full:
            if (subnetIndex_ >= options_.subnets.size()) {
                return std::nullopt;
            }
            if (host_ > options_.scan_range_end) {
                ++subnetIndex_;
                host_ = options_.scan_range_start;
                break;
            }
            return Candidate{makeEndpoint(options_.subnets[subnetIndex_], host_++), CandidatePhase::Full, 0};
        }
    }
}

auto CandidateSequence::next() -> std::optional<Candidate> {
    if (peeked_) {
        return std::exchange(peeked_, std::nullopt);
    }
    while (auto candidate = generate()) {
        if (!seen_.insert(candidate->endpoint.key()).second) {
            continue;
        }
        candidate->index = produced_++;
        return candidate;
    }
    return std::nullopt;
}

auto CandidateSequence::nextBatch(std::size_t max) -> std::vector<Candidate> {
    std::vector<Candidate> batch;
    if (max == 0) {
        return batch;
    }
    while (batch.size() < max) {
        auto candidate = next();
        if (!candidate) {
            break;
        }
        if (!batch.empty() && candidate->phase != batch.front().phase) {
            peeked_ = std::move(candidate);
            break;
        }
        batch.push_back(std::move(*candidate));
    }
    return batch;
}

CandidateResolver::CandidateResolver(DiscoveryOptions const& options)
    : options_(options) {
    if (!options_.override_url.empty()) {
        if (auto parsed = parseEndpointUrl(options_.override_url)) {
            override_ = std::move(*parsed);
        } else {
            cl_log("Ignoring backend override: " + describeError(parsed.error()), "Discovery", "ERROR");
        }
    }
}

auto CandidateResolver::resolve(std::optional<Endpoint> last_known) const -> CandidateSequence {
    return CandidateSequence{options_, override_, std::move(last_known)};
}

} // namespace CL
