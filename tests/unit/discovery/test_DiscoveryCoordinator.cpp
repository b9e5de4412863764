#include <doctest/doctest.h>

#include "discovery/DiscoveryCoordinator.hpp"
#include "loopback/LoopbackNetwork.hpp"
#include "loopback/SyntheticBackend.hpp"
#include "unit/ChamberTestHelper.hpp"

#include <filesystem>
#include <stop_token>
#include <thread>

using namespace CL;
using namespace std::chrono_literals;
using CL::Test::endpoint;
using CL::Test::EventRecorder;
using CL::Test::waitFor;

namespace {

auto threeSubnets() -> ClientOptions {
    auto options               = CL::Test::fastOptions();
    options.discovery.subnets  = {"10.0.0", "10.0.1", "10.0.2"};
    return options;
}

struct DiscoveryFixture {
    explicit DiscoveryFixture(ClientOptions options)
        : context(ClientContext::create(std::move(options)))
        , coordinator(*context, hub, network.httpFactory())
        , recorder(hub) {}

    void attach(Endpoint const& target) { network.attach(target, std::make_shared<Loopback::SyntheticBackend>()); }

    Loopback::Network              network;
    EventHub                       hub;
    std::unique_ptr<ClientContext> context;
    DiscoveryCoordinator           coordinator;
    EventRecorder                  recorder;
};

auto tempPath(std::string const& name) -> std::string {
    auto path = std::filesystem::temp_directory_path() / ("chamberlink-" + name + ".json");
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path.string();
}

} // namespace

TEST_SUITE("discovery.coordinator") {

TEST_CASE("first verified candidate in resolver order wins") {
    SUBCASE("one probe at a time") {
        auto options                      = threeSubnets();
        options.discovery.max_concurrency = 1;
        DiscoveryFixture fixture{options};
        fixture.attach(endpoint("10.0.1.100"));
        fixture.attach(endpoint("10.0.2.100"));

        auto result = fixture.coordinator.discover();
        REQUIRE(result.has_value());
        CHECK(result->endpoint == endpoint("10.0.1.100"));
        CHECK(fixture.network.requestCount(endpoint("10.0.2.100")) == 0);
    }

    SUBCASE("parallel batch prefers the lower index") {
        DiscoveryFixture fixture{threeSubnets()};
        fixture.attach(endpoint("10.0.1.100"));
        fixture.attach(endpoint("10.0.2.100"));
        fixture.network.setLatency(endpoint("10.0.2.100"), 50ms);

        auto result = fixture.coordinator.discover();
        REQUIRE(result.has_value());
        CHECK(result->endpoint == endpoint("10.0.1.100"));
        // The slower probe was cut short rather than awaited.
        CHECK(waitFor([&] { return fixture.network.cancelledRequests() >= 1; }));
    }
}

TEST_CASE("a cached result is returned without new probes") {
    DiscoveryFixture fixture{threeSubnets()};
    fixture.attach(endpoint("10.0.0.100"));

    auto first = fixture.coordinator.discover();
    REQUIRE(first.has_value());
    auto const requests = fixture.network.totalRequests();

    auto second = fixture.coordinator.discover();
    REQUIRE(second.has_value());
    CHECK(second->endpoint == first->endpoint);
    CHECK(fixture.network.totalRequests() == requests);

    auto stats = fixture.coordinator.stats();
    CHECK(stats.cycles == 1);
    CHECK(stats.cache_hits == 1);
    CHECK(fixture.recorder.count(EventKind::DiscoveryComplete) == 1);
}

TEST_CASE("reset probes again starting from the last known endpoint") {
    DiscoveryFixture fixture{threeSubnets()};
    fixture.attach(endpoint("10.0.2.100"));
    REQUIRE(fixture.coordinator.discover().has_value());

    fixture.coordinator.reset();
    CHECK_FALSE(fixture.context->discoveryCache().current().has_value());
    REQUIRE(fixture.context->discoveryCache().lastKnown().has_value());

    fixture.network.resetCounters();
    auto again = fixture.coordinator.discover();
    REQUIRE(again.has_value());
    CHECK(again->endpoint == endpoint("10.0.2.100"));
    // Only the last known endpoint was needed.
    CHECK(fixture.network.requestCount(endpoint("10.0.0.100")) == 0);

    fixture.coordinator.forget();
    CHECK_FALSE(fixture.context->discoveryCache().lastKnown().has_value());
}

TEST_CASE("exhausted candidates report NoBackendFound") {
    DiscoveryFixture fixture{threeSubnets()};
    auto             result = fixture.coordinator.discover();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::NoBackendFound);

    auto failed = fixture.recorder.last<DiscoveryFailed>();
    REQUIRE(failed.has_value());
    CHECK(failed->candidates_tried == 3);
    CHECK(fixture.coordinator.stats().failures == 1);
    CHECK_FALSE(fixture.context->discoveryCache().current().has_value());
}

TEST_CASE("override disables scanning") {
    auto options                   = threeSubnets();
    options.discovery.override_url = "http://10.0.0.50:8000";
    DiscoveryFixture fixture{options};
    fixture.attach(endpoint("10.0.0.100"));

    auto result = fixture.coordinator.discover();
    REQUIRE_FALSE(result.has_value());
    CHECK(fixture.network.requestCount(endpoint("10.0.0.100")) == 0);

    fixture.attach(endpoint("10.0.0.50"));
    auto found = fixture.coordinator.discover();
    REQUIRE(found.has_value());
    CHECK(found->endpoint == endpoint("10.0.0.50"));
}

TEST_CASE("cancel aborts a discovery in progress") {
    DiscoveryFixture fixture{threeSubnets()};
    fixture.attach(endpoint("10.0.0.100"));
    fixture.network.setLatency(endpoint("10.0.0.100"), 150ms);

    std::optional<Expected<DiscoveryResult>> outcome;
    std::thread worker([&] { outcome.emplace(fixture.coordinator.discover()); });
    REQUIRE(waitFor([&] { return fixture.network.totalRequests() > 0; }));
    fixture.coordinator.cancel();
    worker.join();

    REQUIRE(outcome.has_value());
    REQUIRE_FALSE(outcome->has_value());
    CHECK(outcome->error().code == Error::Code::Cancelled);
}

TEST_CASE("a stop requested before entry fails without sending requests") {
    DiscoveryFixture fixture{threeSubnets()};
    fixture.attach(endpoint("10.0.0.100"));

    std::stop_source stop;
    stop.request_stop();
    auto result = fixture.coordinator.discover(stop.get_token());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Cancelled);
    CHECK(fixture.network.totalRequests() == 0);
    CHECK(fixture.coordinator.stats().cycles == 0);

    // The stop belonged to that call; the next one runs normally.
    CHECK(fixture.coordinator.discover().has_value());
}

TEST_CASE("a stop token aborts a discovery in progress") {
    DiscoveryFixture fixture{threeSubnets()};
    fixture.attach(endpoint("10.0.0.100"));
    fixture.network.setLatency(endpoint("10.0.0.100"), 150ms);

    std::stop_source                         stop;
    std::optional<Expected<DiscoveryResult>> outcome;
    std::thread worker([&] { outcome.emplace(fixture.coordinator.discover(stop.get_token())); });
    CHECK(waitFor([&] { return fixture.network.totalRequests() > 0; }));
    stop.request_stop();
    worker.join();

    REQUIRE(outcome.has_value());
    REQUIRE_FALSE(outcome->has_value());
    CHECK(outcome->error().code == Error::Code::Cancelled);
}

TEST_CASE("a loser stuck connecting does not hold up the winner") {
    auto options                      = threeSubnets();
    options.discovery.max_concurrency = 3;
    DiscoveryFixture fixture{options};
    fixture.attach(endpoint("10.0.0.100"));
    // Blocks like a TCP connect to an absent host: cancel() cannot reach it.
    fixture.network.attach(endpoint("10.0.1.100"), std::make_shared<Loopback::LambdaHost>([](Loopback::Request const&) {
                               std::this_thread::sleep_for(800ms);
                               return HttpReply{503, "{}"};
                           }));

    auto const started = std::chrono::steady_clock::now();
    auto       result  = fixture.coordinator.discover();
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.has_value());
    CHECK(result->endpoint == endpoint("10.0.0.100"));
    CHECK(elapsed < 400ms);
    CHECK(fixture.coordinator.stragglers() == 1);

    // The next cycle reaps it once it has finished.
    std::this_thread::sleep_for(900ms);
    fixture.coordinator.reset();
    REQUIRE(fixture.coordinator.discover().has_value());
    CHECK(fixture.coordinator.stragglers() == 0);
}

TEST_CASE("verified endpoint persists to the cache file") {
    auto const path                  = tempPath("discovery-hint");
    auto       options               = threeSubnets();
    options.discovery.cache_file     = path;
    {
        DiscoveryFixture fixture{options};
        fixture.attach(endpoint("10.0.1.100"));
        REQUIRE(fixture.coordinator.discover().has_value());
    }

    auto hint = loadEndpointHint(path);
    REQUIRE(hint.has_value());
    CHECK(*hint == endpoint("10.0.1.100"));

    // A fresh context starts from the persisted hint.
    DiscoveryFixture restarted{options};
    REQUIRE(restarted.context->discoveryCache().lastKnown().has_value());
    restarted.attach(endpoint("10.0.0.100"));
    restarted.attach(endpoint("10.0.1.100"));
    auto result = restarted.coordinator.discover();
    REQUIRE(result.has_value());
    CHECK(result->endpoint == endpoint("10.0.1.100"));

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // TEST_SUITE
