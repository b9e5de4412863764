#include <doctest/doctest.h>

#include "loopback/LoopbackNetwork.hpp"
#include "loopback/SyntheticBackend.hpp"
#include "session/ConnectionSession.hpp"
#include "unit/ChamberTestHelper.hpp"

#include <atomic>
#include <string>

using namespace CL;
using namespace std::chrono_literals;
using CL::Test::endpoint;
using CL::Test::EventRecorder;
using CL::Test::waitFor;

namespace {

// HTTP goes to a synthetic backend; streams are handed to the test to script.
class ScriptedStreamHost final : public Loopback::Host {
public:
    auto handle(Loopback::Request const& request) -> HttpReply override { return backend.handle(request); }

    auto openStream(std::string const&) -> Expected<std::shared_ptr<Loopback::Stream>> override {
        auto stream = std::make_shared<Loopback::Stream>();
        std::lock_guard<std::mutex> lock(mutex);
        latest = stream;
        return stream;
    }

    auto current() -> std::shared_ptr<Loopback::Stream> {
        std::lock_guard<std::mutex> lock(mutex);
        return latest;
    }

    Loopback::SyntheticBackend       backend;
    std::mutex                       mutex;
    std::shared_ptr<Loopback::Stream> latest;
};

struct SessionFixture {
    explicit SessionFixture(ClientOptions options = CL::Test::fastOptions())
        : context(ClientContext::create(std::move(options)))
        , discovery(*context, hub, network.httpFactory())
        , session(*context, hub, discovery, network.streamFactory())
        , recorder(hub) {}

    auto connected() -> bool {
        return waitFor([&] { return session.state() == ConnectionState::Connected; });
    }

    Loopback::Network              network;
    EventHub                       hub;
    std::unique_ptr<ClientContext> context;
    DiscoveryCoordinator           discovery;
    ConnectionSession              session;
    EventRecorder                  recorder;
};

} // namespace

TEST_SUITE("session.connection") {

TEST_CASE("connects, stores snapshots and publishes them afterwards") {
    SessionFixture fixture;
    auto           backend = std::make_shared<Loopback::SyntheticBackend>();
    fixture.network.attach(endpoint("10.0.0.100"), backend);

    std::atomic<bool> storedFirst{true};
    fixture.hub.subscribe(EventKind::StatusUpdate, [&](Event const& event) {
        auto const& received = std::get<SnapshotReceived>(event);
        auto        latest   = fixture.context->snapshots().latest();
        if (!latest || latest->sequence < received.snapshot->sequence) {
            storedFirst = false;
        }
    });

    CHECK(fixture.session.state() == ConnectionState::Idle);
    fixture.session.start();
    REQUIRE(fixture.connected());
    REQUIRE(waitFor([&] { return fixture.context->snapshots().sequence() >= 1; }));

    backend->setValue("control_panel.ac_state", true);
    REQUIRE(waitFor([&] { return fixture.context->snapshots().sequence() >= 2; }));
    auto latest = fixture.context->snapshots().latest();
    REQUIRE(latest);
    CHECK(latest->valueAt("control_panel.ac_state").value_or(nlohmann::json{}) == nlohmann::json(true));
    CHECK(storedFirst);

    auto changes = fixture.recorder.all<ConnectionStateChanged>();
    REQUIRE(changes.size() >= 2);
    CHECK(changes[0].current == ConnectionState::Discovering);
    CHECK(changes[1].current == ConnectionState::Connected);

    fixture.session.disconnect();
    CHECK(fixture.session.state() == ConnectionState::Idle);
    CHECK_FALSE(fixture.session.running());
}

TEST_CASE("malformed frames raise stream errors without ending the stream") {
    SessionFixture fixture;
    auto           host = std::make_shared<ScriptedStreamHost>();
    fixture.network.attach(endpoint("10.0.0.100"), host);

    fixture.session.start();
    REQUIRE(fixture.connected());
    REQUIRE(waitFor([&] { return host->current() != nullptr; }));

    host->current()->push("{truncated");
    host->current()->push(R"({"error":"plc offline"})");
    host->current()->push(R"({"type":"status_update","data":{"pressure":{"setpoint":1.4}}})");
    REQUIRE(waitFor([&] { return fixture.context->snapshots().sequence() == 1; }));

    CHECK(fixture.recorder.count(EventKind::StreamError) == 2);
    CHECK(fixture.session.state() == ConnectionState::Connected);
    fixture.session.disconnect();
}

TEST_CASE("reconnect attempts reuse the endpoint until the third rediscovers") {
    auto options                          = CL::Test::fastOptions();
    options.session.max_reconnect_attempts = 5;
    options.session.discovery_reset_every  = 3;
    options.session.reconnect_interval     = 30ms;
    SessionFixture fixture{options};

    auto const target  = endpoint("10.0.0.100");
    auto       backend = std::make_shared<Loopback::SyntheticBackend>();
    fixture.network.attach(target, backend);

    fixture.session.start();
    REQUIRE(fixture.connected());
    REQUIRE(fixture.discovery.stats().cycles == 1);

    fixture.network.setOnline(target, false);
    backend->dropStreams();

    REQUIRE(waitFor([&] { return fixture.discovery.stats().cycles >= 2; }));
    auto scheduled = fixture.recorder.all<ReconnectScheduled>();
    REQUIRE(scheduled.size() >= 3);
    CHECK(scheduled[0].attempt == 1);
    CHECK_FALSE(scheduled[0].reset_discovery);
    CHECK_FALSE(scheduled[1].reset_discovery);
    CHECK(scheduled[2].attempt == 3);
    CHECK(scheduled[2].reset_discovery);
    CHECK(scheduled[2].max_attempts == 5);
    // Attempts 1 and 2 tried the cached endpoint's stream again.
    CHECK(fixture.network.streamConnects(target) >= 3);

    fixture.network.setOnline(target, true);
    REQUIRE(fixture.connected());
    CHECK(fixture.session.attempts() == 0);
    fixture.session.disconnect();
}

TEST_CASE("giving up publishes max reconnects and stays disconnected") {
    auto options                           = CL::Test::fastOptions();
    options.session.max_reconnect_attempts = 2;
    options.session.reconnect_interval     = 10ms;
    SessionFixture fixture{options};

    fixture.session.start();
    REQUIRE(waitFor([&] { return fixture.session.exhausted(); }));

    auto reached = fixture.recorder.last<MaxReconnectsReached>();
    REQUIRE(reached.has_value());
    CHECK(reached->attempts == 2);
    CHECK(reached->error.code == Error::Code::MaxReconnectsExceeded);
    CHECK(describeError(reached->error) == "max_reconnects_exceeded:gave up after 2 reconnect attempt(s)");
    CHECK(fixture.session.state() == ConnectionState::Disconnected);
    CHECK_FALSE(fixture.session.running());
    CHECK(fixture.recorder.count(EventKind::DiscoveryFailed) == 3);

    SUBCASE("manual reconnect starts over") {
        fixture.network.attach(endpoint("10.0.0.100"), std::make_shared<Loopback::SyntheticBackend>());
        fixture.session.reconnect();
        REQUIRE(fixture.connected());
        CHECK_FALSE(fixture.session.exhausted());
        CHECK(fixture.session.attempts() == 0);
        fixture.session.disconnect();
    }
}

TEST_CASE("an idle stream is closed and reopened") {
    auto options                 = CL::Test::fastOptions();
    options.session.idle_timeout = 80ms;
    SessionFixture fixture{options};

    auto const target  = endpoint("10.0.0.100");
    auto       backend = std::make_shared<Loopback::SyntheticBackend>();
    backend->pauseStreaming(true);
    fixture.network.attach(target, backend);

    fixture.session.start();
    REQUIRE(waitFor([&] { return fixture.network.streamConnects(target) >= 2; }));
    CHECK(fixture.recorder.count(EventKind::ReconnectScheduled) >= 1);
    fixture.session.disconnect();
    CHECK(fixture.session.state() == ConnectionState::Idle);
}

TEST_CASE("disconnect interrupts a pending reconnect delay") {
    auto options                       = CL::Test::fastOptions();
    options.session.reconnect_interval = 10s;
    SessionFixture fixture{options};

    fixture.session.start();
    REQUIRE(waitFor([&] { return fixture.recorder.count(EventKind::ReconnectScheduled) == 1; }));

    auto const began = std::chrono::steady_clock::now();
    fixture.session.disconnect();
    CHECK(std::chrono::steady_clock::now() - began < 2s);
    CHECK(fixture.session.state() == ConnectionState::Idle);
}

TEST_CASE("disconnect during a subnet scan stops discovery") {
    SessionFixture fixture;
    for (int octet = 1; octet <= 254; ++octet) {
        auto const target = endpoint("10.0.0." + std::to_string(octet));
        fixture.network.attach(target, std::make_shared<Loopback::LambdaHost>([](Loopback::Request const&) {
                                   return HttpReply{503, "{}"};
                               }));
        fixture.network.setLatency(target, 150ms);
    }

    fixture.session.start();
    REQUIRE(waitFor([&] { return fixture.network.totalRequests() >= 1; }));

    auto const began = std::chrono::steady_clock::now();
    fixture.session.disconnect();
    CHECK(std::chrono::steady_clock::now() - began < 1s);
    CHECK(fixture.session.state() == ConnectionState::Idle);
    CHECK(fixture.recorder.count(EventKind::DiscoveryFailed) == 0);
    CHECK(fixture.network.totalRequests() < 254);
}

} // TEST_SUITE
