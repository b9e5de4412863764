#pragma once

#include "discovery/CandidateResolver.hpp"
#include "discovery/Verifier.hpp"
#include "events/EventHub.hpp"
#include "runtime/ClientContext.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace CL {

struct DiscoveryStats {
    std::uint64_t cycles{0};
    std::uint64_t cache_hits{0};
    std::uint64_t probes_issued{0};
    std::uint64_t failures{0};
};

/*
 * Finds the backend. Candidates are probed in resolver order, in batches of at
 * most max_concurrency parallel probes. Within a batch the lowest-index success
 * observed when the coordinator wakes wins and the remaining probes are
 * cancelled. discover() does not wait for them: a probe still stuck in a TCP
 * connect is kept as a straggler, reaped once it finishes and joined at the
 * latest by the destructor. A verified result is cached in the context and
 * returned without probing until reset() or forget().
 */
class DiscoveryCoordinator {
public:
    DiscoveryCoordinator(ClientContext& context, EventBus& events, std::shared_ptr<HttpClientFactory> http);
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(DiscoveryCoordinator const&)            = delete;
    DiscoveryCoordinator& operator=(DiscoveryCoordinator const&) = delete;

    // Fails with Cancelled, before any request, when `stop` is already requested.
    [[nodiscard]] auto discover(std::stop_token stop = {}) -> Expected<DiscoveryResult>;

    // Drops the verified result; the next discover() starts over from the last known endpoint.
    void reset();
    // Drops the verified result and the last known endpoint.
    void forget();
    // Aborts a discover() in progress, which then fails with Cancelled.
    void cancel();

    [[nodiscard]] auto stats() const -> DiscoveryStats;
    [[nodiscard]] auto stragglers() const -> std::size_t;

private:
    struct ProbeBatch;
    struct Straggler {
        std::thread                 thread;
        std::shared_ptr<ProbeBatch> batch;
        std::size_t                 index{0};
    };

    auto probeBatch(std::vector<Candidate> const& batch, std::stop_token const& stop)
        -> Expected<std::optional<DiscoveryResult>>;
    void abortActive();
    void retire(std::vector<std::thread> workers, std::shared_ptr<ProbeBatch> const& batch);
    void reapStragglers(bool wait);

    ClientContext&              context_;
    EventBus&                   events_;
    CandidateResolver           resolver_;
    Verifier                    verifier_;
    std::size_t                 maxConcurrency_;

    std::mutex                  discoverMutex_;
    mutable std::mutex          stateMutex_;
    std::shared_ptr<ProbeBatch> activeBatch_;
    std::optional<std::stop_source> inFlight_;
    DiscoveryStats              stats_;
    std::vector<Straggler>      stragglers_;
};

} // namespace CL
