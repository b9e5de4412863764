#pragma once

#include "events/Events.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace CL {

using SubscriptionId = std::uint64_t;
using EventCallback  = std::function<void(Event const&)>;

class EventBus {
public:
    virtual ~EventBus() = default;

    virtual auto subscribe(EventKind kind, EventCallback callback) -> SubscriptionId = 0;
    virtual auto subscribeAll(EventCallback callback) -> SubscriptionId              = 0;
    // Unknown or already removed ids are ignored.
    virtual void unsubscribe(SubscriptionId id)                                      = 0;
    virtual void publish(Event const& event)                                         = 0;
};

/*
 * Synchronous fan-out in subscription order. Subscribers run on the publishing
 * thread; a subscriber that throws is logged and skipped. The delivery list is
 * copied before dispatch so callbacks may subscribe or unsubscribe freely.
 */
class EventHub final : public EventBus {
public:
    EventHub() = default;
    EventHub(EventHub const&)            = delete;
    EventHub& operator=(EventHub const&) = delete;

    auto subscribe(EventKind kind, EventCallback callback) -> SubscriptionId override;
    auto subscribeAll(EventCallback callback) -> SubscriptionId override;
    void unsubscribe(SubscriptionId id) override;
    void publish(Event const& event) override;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

private:
    struct Subscriber {
        SubscriptionId                id{0};
        std::optional<EventKind>      kind;
        std::shared_ptr<EventCallback> callback;
    };

    mutable std::mutex      mutex_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId          nextId_{1};
};

} // namespace CL
