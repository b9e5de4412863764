#pragma once

#include <chamberlink/ClientOptions.hpp>

#include "core/Types.hpp"
#include "events/EventHub.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace CL::Test {

using namespace std::chrono_literals;

inline auto endpoint(std::string host, std::uint16_t port = 8000) -> Endpoint {
    return Endpoint{"http", std::move(host), port};
}

// Options with timeouts short enough for the loopback network.
inline auto fastOptions() -> ClientOptions {
    ClientOptions options;
    options.discovery.subnets         = {"10.0.0"};
    options.discovery.probe_timeout   = 200ms;
    options.discovery.max_concurrency = 4;
    options.session.connect_timeout   = 200ms;
    options.session.idle_timeout      = 2000ms;
    options.session.reconnect_interval = 20ms;
    options.commands.request_timeout      = 500ms;
    options.commands.confirmation_timeout = 300ms;
    options.commands.poll_interval        = 10ms;
    options.commands.rate_limit_max_commands = 100;
    return options;
}

inline bool waitFor(std::function<bool()> const& predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

// Collects every event published on a bus, thread-safe.
class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus)
        : bus_(bus)
        , id_(bus.subscribeAll([this](Event const& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        })) {}

    ~EventRecorder() { bus_.unsubscribe(id_); }

    EventRecorder(EventRecorder const&)            = delete;
    EventRecorder& operator=(EventRecorder const&) = delete;

    auto kinds() const -> std::vector<EventKind> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EventKind> out;
        for (auto const& event : events_) {
            out.push_back(eventKind(event));
        }
        return out;
    }

    auto count(EventKind kind) const -> std::size_t {
        std::size_t total = 0;
        for (auto seen : kinds()) {
            total += seen == kind ? 1 : 0;
        }
        return total;
    }

    template <typename T>
    auto all() const -> std::vector<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (auto const& event : events_) {
            if (auto const* typed = std::get_if<T>(&event)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

    template <typename T>
    auto last() const -> std::optional<T> {
        auto typed = all<T>();
        if (typed.empty()) {
            return std::nullopt;
        }
        return typed.back();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    EventBus&          bus_;
    mutable std::mutex mutex_;
    std::vector<Event> events_;
    SubscriptionId     id_;
};

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = std::string(existing);
        }
        if (value) {
            setenv(key_.c_str(), value, 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    EnvGuard(EnvGuard const&)            = delete;
    EnvGuard& operator=(EnvGuard const&) = delete;

    ~EnvGuard() {
        if (original_) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

private:
    std::string                key_;
    std::optional<std::string> original_;
};

} // namespace CL::Test
