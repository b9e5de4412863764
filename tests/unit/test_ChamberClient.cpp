#include <doctest/doctest.h>

#include <chamberlink/ChamberClient.hpp>

#include "loopback/LoopbackNetwork.hpp"
#include "loopback/SyntheticBackend.hpp"
#include "unit/ChamberTestHelper.hpp"

using namespace CL;
using namespace std::chrono_literals;
using CL::Test::endpoint;
using CL::Test::EventRecorder;
using CL::Test::waitFor;
using json = nlohmann::json;

namespace {

struct ClientFixture {
    ClientFixture()
        : backend(std::make_shared<Loopback::SyntheticBackend>()) {
        network.attach(endpoint("10.0.0.100"), backend);
        client = std::make_unique<ChamberClient>(CL::Test::fastOptions(),
                                                 Transports{network.httpFactory(), network.streamFactory()});
    }

    auto connect() -> bool {
        client->start();
        return waitFor([&] { return client->state() == ConnectionState::Connected && client->latestSnapshot(); });
    }

    Loopback::Network                           network;
    std::shared_ptr<Loopback::SyntheticBackend> backend;
    std::unique_ptr<ChamberClient>              client;
};

auto setpointOf(ChamberClient const& client) -> double {
    return client.read("pressure_setpoint").value_or(json(0.0)).get<double>();
}

} // namespace

TEST_SUITE("client") {

TEST_CASE("commands before discovery are refused") {
    ClientFixture fixture;
    auto          result = fixture.client->commands().toggleAc();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::CommandRejected);
    CHECK_FALSE(fixture.client->isPending("ac"));
    CHECK(fixture.backend->commandCount() == 0);
}

TEST_CASE("toggles round trip through the live stream") {
    ClientFixture fixture;
    REQUIRE(fixture.connect());
    EventRecorder recorder{fixture.client->events()};

    CHECK(fixture.client->read("ceiling_lights").value_or(json{}) == json(false));
    auto on = fixture.client->commands().toggleCeilingLights();
    REQUIRE(on.has_value());
    CHECK(fixture.client->read("ceiling_lights").value_or(json{}) == json(true));

    auto off = fixture.client->commands().toggle("ceiling_lights");
    REQUIRE(off.has_value());
    CHECK(off->confirmed_value == json(false));
    CHECK(fixture.backend->state()["control_panel"]["ceiling_lights_state"] == json(false));
    CHECK(recorder.count(EventKind::CommandSuccess) == 2);

    auto unknown = fixture.client->commands().toggle("sauna");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == Error::Code::InvalidConfiguration);
}

TEST_CASE("pressure steps across the ceiling") {
    ClientFixture fixture;
    REQUIRE(fixture.connect());
    auto& commands = fixture.client->commands();

    REQUIRE(commands.setPressureSetpoint(1.90).has_value());
    CHECK(setpointOf(*fixture.client) == doctest::Approx(1.90));

    auto up = commands.increasePressure();
    REQUIRE(up.has_value());
    CHECK(up->confirmed_value.get<double>() == doctest::Approx(1.99));

    auto down = commands.decreasePressure();
    REQUIRE(down.has_value());
    CHECK(down->confirmed_value.get<double>() == doctest::Approx(1.90));
    CHECK(fixture.backend->state()["pressure"]["setpoint"].get<double>() == doctest::Approx(1.90));
}

TEST_CASE("session start and end follow the running state") {
    ClientFixture fixture;
    REQUIRE(fixture.connect());

    REQUIRE(fixture.client->commands().startSession().has_value());
    CHECK(fixture.client->read("session_running").value_or(json{}) == json(true));
    REQUIRE(fixture.client->commands().endSession().has_value());
    CHECK(fixture.client->read("session_running").value_or(json{}) == json(false));
}

TEST_CASE("stop returns to idle and reconnect finds the backend again") {
    ClientFixture fixture;
    REQUIRE(fixture.connect());

    fixture.client->stop();
    CHECK(fixture.client->state() == ConnectionState::Idle);

    fixture.client->forgetBackend();
    CHECK_FALSE(fixture.client->context().discoveryCache().lastKnown().has_value());

    fixture.client->reconnect();
    REQUIRE(waitFor([&] { return fixture.client->state() == ConnectionState::Connected; }));
    CHECK(fixture.client->discovery().stats().cycles == 2);
}

} // TEST_SUITE
