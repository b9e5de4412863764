#include "events/EventHub.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace CL {

auto eventKind(Event const& event) -> EventKind {
    struct Visitor {
        auto operator()(ConnectionStateChanged const&) const { return EventKind::ConnectionState; }
        auto operator()(DiscoveryComplete const&) const { return EventKind::DiscoveryComplete; }
        auto operator()(DiscoveryFailed const&) const { return EventKind::DiscoveryFailed; }
        auto operator()(SnapshotReceived const&) const { return EventKind::StatusUpdate; }
        auto operator()(StreamError const&) const { return EventKind::StreamError; }
        auto operator()(ReconnectScheduled const&) const { return EventKind::ReconnectScheduled; }
        auto operator()(MaxReconnectsReached const&) const { return EventKind::MaxReconnectsReached; }
        auto operator()(OptimisticUpdate const&) const { return EventKind::OptimisticUpdate; }
        auto operator()(ControlsUpdated const&) const { return EventKind::ControlsUpdate; }
        auto operator()(CommandSucceeded const&) const { return EventKind::CommandSuccess; }
        auto operator()(CommandFailed const&) const { return EventKind::CommandError; }
    };
    return std::visit(Visitor{}, event);
}

auto eventName(EventKind kind) -> std::string_view {
    switch (kind) {
    case EventKind::ConnectionState:
        return "connection-state";
    case EventKind::DiscoveryComplete:
        return "discovery-complete";
    case EventKind::DiscoveryFailed:
        return "discovery-failed";
    case EventKind::StatusUpdate:
        return "status-update";
    case EventKind::StreamError:
        return "stream-error";
    case EventKind::ReconnectScheduled:
        return "reconnect-scheduled";
    case EventKind::MaxReconnectsReached:
        return "max-reconnects-reached";
    case EventKind::OptimisticUpdate:
        return "optimistic-update";
    case EventKind::ControlsUpdate:
        return "controls-update";
    case EventKind::CommandSuccess:
        return "command-success";
    case EventKind::CommandError:
        return "command-error";
    }
    return "unknown";
}

auto EventHub::subscribe(EventKind kind, EventCallback callback) -> SubscriptionId {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    subscribers_.push_back(Subscriber{id, kind, std::make_shared<EventCallback>(std::move(callback))});
    return id;
}

auto EventHub::subscribeAll(EventCallback callback) -> SubscriptionId {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    subscribers_.push_back(Subscriber{id, std::nullopt, std::make_shared<EventCallback>(std::move(callback))});
    return id;
}

void EventHub::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(subscribers_, [id](Subscriber const& entry) { return entry.id == id; });
}

void EventHub::publish(Event const& event) {
    auto const kind = eventKind(event);
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (auto const& entry : subscribers_) {
            if (!entry.kind || *entry.kind == kind) {
                targets.push_back(entry);
            }
        }
    }

    for (auto const& target : targets) {
        try {
            (*target.callback)(event);
        } catch (std::exception const& error) {
            cl_log("Subscriber " + std::to_string(target.id) + " threw on " + std::string{eventName(kind)} + ": "
                       + error.what(),
                   "EventHub",
                   "ERROR");
        } catch (...) {
            cl_log("Subscriber " + std::to_string(target.id) + " threw a non-standard exception on "
                       + std::string{eventName(kind)},
                   "EventHub",
                   "ERROR");
        }
    }
}

auto EventHub::subscriberCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace CL
