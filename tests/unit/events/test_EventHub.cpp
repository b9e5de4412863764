#include <doctest/doctest.h>

#include "events/EventHub.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace CL;

TEST_SUITE("events.hub") {

TEST_CASE("subscribers receive only their kind in subscription order") {
    EventHub                 hub;
    std::vector<std::string> seen;

    hub.subscribe(EventKind::ConnectionState, [&](Event const&) { seen.push_back("first"); });
    hub.subscribe(EventKind::CommandError, [&](Event const&) { seen.push_back("wrong-kind"); });
    hub.subscribeAll([&](Event const& event) { seen.push_back(std::string{eventName(eventKind(event))}); });
    hub.subscribe(EventKind::ConnectionState, [&](Event const& event) {
        auto const& change = std::get<ConnectionStateChanged>(event);
        CHECK(change.previous == ConnectionState::Idle);
        CHECK(change.current == ConnectionState::Discovering);
        seen.push_back("last");
    });

    hub.publish(ConnectionStateChanged{ConnectionState::Idle, ConnectionState::Discovering});
    CHECK(seen == std::vector<std::string>{"first", "connection-state", "last"});
}

TEST_CASE("a throwing subscriber does not stop delivery") {
    EventHub hub;
    int      delivered = 0;

    hub.subscribeAll([](Event const&) { throw std::runtime_error("subscriber failure"); });
    hub.subscribeAll([](Event const&) { throw 42; });
    hub.subscribeAll([&](Event const&) { ++delivered; });

    CHECK_NOTHROW(hub.publish(MaxReconnectsReached{5}));
    CHECK(delivered == 1);
}

TEST_CASE("unsubscribe stops delivery and tolerates unknown ids") {
    EventHub hub;
    int      count = 0;
    auto     id    = hub.subscribe(EventKind::StatusUpdate, [&](Event const&) { ++count; });

    hub.publish(SnapshotReceived{});
    hub.unsubscribe(id);
    hub.publish(SnapshotReceived{});
    CHECK(count == 1);

    hub.unsubscribe(id);
    hub.unsubscribe(9999);
    CHECK(hub.subscriberCount() == 0);
}

TEST_CASE("callbacks may unsubscribe during dispatch") {
    EventHub       hub;
    int            calls = 0;
    SubscriptionId self  = 0;
    self = hub.subscribeAll([&](Event const&) {
        ++calls;
        hub.unsubscribe(self);
    });
    int others = 0;
    hub.subscribeAll([&](Event const&) { ++others; });

    hub.publish(DiscoveryFailed{3});
    hub.publish(DiscoveryFailed{3});
    CHECK(calls == 1);
    CHECK(others == 2);
}

TEST_CASE("every event has a stable name") {
    CHECK(eventName(eventKind(DiscoveryComplete{})) == "discovery-complete");
    CHECK(eventName(eventKind(DiscoveryFailed{})) == "discovery-failed");
    CHECK(eventName(eventKind(StreamError{Error{Error::Code::StreamClosed, "closed"}})) == "stream-error");
    CHECK(eventName(eventKind(ReconnectScheduled{})) == "reconnect-scheduled");
    CHECK(eventName(eventKind(MaxReconnectsReached{})) == "max-reconnects-reached");
    CHECK(eventName(eventKind(OptimisticUpdate{})) == "optimistic-update");
    CHECK(eventName(eventKind(ControlsUpdated{})) == "controls-update");
    CHECK(eventName(eventKind(CommandSucceeded{})) == "command-success");
    CHECK(eventName(eventKind(CommandFailed{"ac", "ac_1", Error{Error::Code::CommandRejected, "no"}})) == "command-error");
}

} // TEST_SUITE
