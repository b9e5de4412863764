#pragma once

#include <chamberlink/ClientOptions.hpp>

#include "core/Types.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CL {

enum class CandidatePhase {
    Override,
    LastKnown,
    Quick,
    Full
};

[[nodiscard]] auto toString(CandidatePhase phase) -> std::string_view;

struct Candidate {
    Endpoint       endpoint;
    CandidatePhase phase{CandidatePhase::Quick};
    std::size_t    index{0};
};

/*
 * Lazily walks the candidate phases in order: an explicit override alone, or
 * the last known endpoint, one quick host per subnet, then (when enabled) every
 * host of every subnet. Each endpoint is produced at most once.
 */
class CandidateSequence {
public:
    CandidateSequence(DiscoveryOptions const& options, std::optional<Endpoint> override_endpoint,
                      std::optional<Endpoint> last_known);

    [[nodiscard]] auto next() -> std::optional<Candidate>;

    // Up to max candidates, never mixing phases. Empty once exhausted.
    [[nodiscard]] auto nextBatch(std::size_t max) -> std::vector<Candidate>;

    [[nodiscard]] bool overrideOnly() const { return override_.has_value(); }
    [[nodiscard]] auto produced() const -> std::size_t { return produced_; }

private:
    auto generate() -> std::optional<Candidate>;
    auto makeEndpoint(std::string const& subnet, int host) const -> Endpoint;

    DiscoveryOptions const&         options_;
    std::optional<Endpoint>         override_;
    std::optional<Endpoint>         lastKnown_;
    CandidatePhase                  phase_{CandidatePhase::Override};
    std::size_t                     subnetIndex_{0};
    int                             host_{0};
    std::size_t                     produced_{0};
    std::optional<Candidate>        peeked_;
    phmap::flat_hash_set<std::string> seen_;
};

class CandidateResolver {
public:
    explicit CandidateResolver(DiscoveryOptions const& options);

    // A fresh sequence on every call; no cursor is shared between calls.
    [[nodiscard]] auto resolve(std::optional<Endpoint> last_known) const -> CandidateSequence;

    [[nodiscard]] auto options() const -> DiscoveryOptions const& { return options_; }

private:
    DiscoveryOptions        options_;
    std::optional<Endpoint> override_;
};

} // namespace CL
