#include "discovery/DiscoveryCoordinator.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <condition_variable>
#include <iterator>

namespace CL {

struct DiscoveryCoordinator::ProbeBatch {
    std::mutex                                   mutex;
    std::condition_variable                      cv;
    std::vector<std::unique_ptr<HttpClient>>     clients;
    std::vector<std::optional<DiscoveryResult>>  results;
    std::vector<bool>                            done;
    std::size_t                                  finished{0};
    bool                                         aborted{false};

    void cancelAll() {
        for (auto& client : clients) {
            client->cancel();
        }
    }
};

DiscoveryCoordinator::DiscoveryCoordinator(ClientContext& context, EventBus& events,
                                           std::shared_ptr<HttpClientFactory> http)
    : context_(context)
    , events_(events)
    , resolver_(context.options().discovery)
    , verifier_(context.options().discovery, std::move(http))
    , maxConcurrency_(static_cast<std::size_t>(std::max(1, context.options().discovery.max_concurrency))) {}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    cancel();
    std::lock_guard<std::mutex> wait(discoverMutex_);
    reapStragglers(true);
}

auto DiscoveryCoordinator::discover(std::stop_token stop) -> Expected<DiscoveryResult> {
    std::lock_guard<std::mutex> serial(discoverMutex_);

    // cancel() and the caller's token both stop this call only.
    std::stop_source own;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        inFlight_ = own;
    }
    struct InFlightGuard {
        DiscoveryCoordinator& self;
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(self.stateMutex_);
            self.inFlight_.reset();
        }
    } guard{*this};
    std::stop_callback linked(stop, [&own] { own.request_stop(); });
    std::stop_callback abortOnStop(own.get_token(), [this] { abortActive(); });
    auto const token = own.get_token();

    if (token.stop_requested()) {
        return std::unexpected(Error{Error::Code::Cancelled, "discovery cancelled"});
    }

    if (auto cached = context_.discoveryCache().current()) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.cache_hits;
        return *cached;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.cycles;
    }

    auto sequence = resolver_.resolve(context_.discoveryCache().lastKnown());
    cl_log(sequence.overrideOnly() ? "Discovery using configured backend" : "Discovery scanning candidates",
           "Discovery");

    while (true) {
        auto batch = sequence.nextBatch(maxConcurrency_);
        if (batch.empty()) {
            break;
        }
        cl_log("Probing " + std::to_string(batch.size()) + " " + std::string{toString(batch.front().phase)}
                   + " candidate(s)",
               "Discovery");
        auto outcome = probeBatch(batch, token);
        if (!outcome) {
            return std::unexpected(outcome.error());
        }
        if (*outcome) {
            auto result = std::move(**outcome);
            context_.discoveryCache().store(result);
            cl_log("Discovered backend at " + result.endpoint.toUrl(), "Discovery");
            events_.publish(DiscoveryComplete{result});
            return result;
        }
    }

    auto const tried = sequence.produced();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++stats_.failures;
    }
    cl_log("No backend found after " + std::to_string(tried) + " candidate(s)", "Discovery");
    events_.publish(DiscoveryFailed{tried});
    return std::unexpected(
        Error{Error::Code::NoBackendFound, "no verified backend among " + std::to_string(tried) + " candidate(s)"});
}

auto DiscoveryCoordinator::probeBatch(std::vector<Candidate> const& batch, std::stop_token const& stop)
    -> Expected<std::optional<DiscoveryResult>> {
    reapStragglers(false);

    auto probes = std::make_shared<ProbeBatch>();
    probes->results.resize(batch.size());
    probes->done.resize(batch.size(), false);
    probes->clients.reserve(batch.size());
    for (auto const& candidate : batch) {
        probes->clients.push_back(verifier_.makeClient(candidate.endpoint));
    }
    {
        // abortActive() reads activeBatch_ under the same lock, so a stop
        // requested after this check always finds the batch.
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (stop.stop_requested()) {
            return std::unexpected(Error{Error::Code::Cancelled, "discovery cancelled"});
        }
        activeBatch_ = probes;
        stats_.probes_issued += batch.size();
    }

    std::vector<std::thread> workers;
    workers.reserve(batch.size());
    for (std::size_t idx = 0; idx < batch.size(); ++idx) {
        workers.emplace_back([this, probes, idx, endpoint = batch[idx].endpoint] {
            auto verified = verifier_.verify(endpoint, *probes->clients[idx]);
            if (!verified) {
                cl_log(describeError(verified.error()), "Probe");
            }
            std::lock_guard<std::mutex> lock(probes->mutex);
            if (verified) {
                probes->results[idx] = std::move(*verified);
            }
            probes->done[idx] = true;
            ++probes->finished;
            probes->cv.notify_all();
        });
    }

    std::optional<DiscoveryResult> winner;
    {
        std::unique_lock<std::mutex> lock(probes->mutex);
        probes->cv.wait(lock, [&] {
            return probes->aborted || probes->finished == batch.size()
                || std::ranges::any_of(probes->results, [](auto const& result) { return result.has_value(); });
        });
        if (auto it = std::ranges::find_if(probes->results, [](auto const& result) { return result.has_value(); });
            it != probes->results.end()) {
            winner = *it;
        }
    }

    probes->cancelAll();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        activeBatch_.reset();
    }
    retire(std::move(workers), probes);

    if (!winner && stop.stop_requested()) {
        return std::unexpected(Error{Error::Code::Cancelled, "discovery cancelled"});
    }
    return winner;
}

void DiscoveryCoordinator::retire(std::vector<std::thread> workers, std::shared_ptr<ProbeBatch> const& batch) {
    std::vector<bool> done;
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        done = batch->done;
    }
    std::vector<Straggler> pending;
    for (std::size_t idx = 0; idx < workers.size(); ++idx) {
        if (done[idx]) {
            workers[idx].join();
        } else {
            pending.push_back(Straggler{std::move(workers[idx]), batch, idx});
        }
    }
    if (pending.empty()) {
        return;
    }
    cl_log(std::to_string(pending.size()) + " cancelled probe(s) still connecting", "Discovery");
    std::lock_guard<std::mutex> lock(stateMutex_);
    std::ranges::move(pending, std::back_inserter(stragglers_));
}

void DiscoveryCoordinator::reapStragglers(bool wait) {
    std::vector<Straggler> reaped;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto finished = std::ranges::stable_partition(stragglers_, [wait](Straggler const& straggler) {
            if (wait) {
                return false;
            }
            std::lock_guard<std::mutex> batchLock(straggler.batch->mutex);
            return !straggler.batch->done[straggler.index];
        });
        std::ranges::move(finished, std::back_inserter(reaped));
        stragglers_.erase(finished.begin(), finished.end());
    }
    for (auto& straggler : reaped) {
        straggler.thread.join();
    }
}

void DiscoveryCoordinator::reset() {
    context_.discoveryCache().clearCurrent();
    cl_log("Discovery cache reset", "Discovery");
}

void DiscoveryCoordinator::forget() {
    context_.discoveryCache().clearAll();
    cl_log("Discovery cache forgotten", "Discovery");
}

void DiscoveryCoordinator::cancel() {
    std::optional<std::stop_source> current;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        current = inFlight_;
    }
    if (current) {
        current->request_stop();
    }
}

void DiscoveryCoordinator::abortActive() {
    std::shared_ptr<ProbeBatch> active;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        active = activeBatch_;
    }
    if (!active) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(active->mutex);
        active->aborted = true;
    }
    active->cv.notify_all();
    active->cancelAll();
}

auto DiscoveryCoordinator::stats() const -> DiscoveryStats {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return stats_;
}

auto DiscoveryCoordinator::stragglers() const -> std::size_t {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return stragglers_.size();
}

} // namespace CL
