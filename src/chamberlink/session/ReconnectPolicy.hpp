#pragma once

#include <chamberlink/ClientOptions.hpp>

#include <chrono>

namespace CL {

struct ReconnectDecision {
    int                       attempt{0};
    std::chrono::milliseconds delay{0};
    bool                      reset_discovery{false};
    bool                      exhausted{false};
};

// Bounded retries at a fixed interval; every nth attempt also drops the
// discovery cache so a moved backend is found again.
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(SessionOptions const& options)
        : maxAttempts_(options.max_reconnect_attempts)
        , interval_(options.reconnect_interval)
        , resetEvery_(options.discovery_reset_every < 1 ? 1 : options.discovery_reset_every) {}

    [[nodiscard]] auto next() -> ReconnectDecision {
        ReconnectDecision decision;
        decision.attempt = ++attempts_;
        if (decision.attempt > maxAttempts_) {
            decision.exhausted = true;
            return decision;
        }
        decision.delay           = interval_;
        decision.reset_discovery = decision.attempt % resetEvery_ == 0;
        return decision;
    }

    void reset() { attempts_ = 0; }

    [[nodiscard]] auto attempts() const -> int { return attempts_; }
    [[nodiscard]] auto maxAttempts() const -> int { return maxAttempts_; }

private:
    int                       maxAttempts_;
    std::chrono::milliseconds interval_;
    int                       resetEvery_;
    int                       attempts_{0};
};

} // namespace CL
