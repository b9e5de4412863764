#include <doctest/doctest.h>

#include <chamberlink/ClientOptions.hpp>

#include "unit/ChamberTestHelper.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using CL::Test::EnvGuard;

namespace {

class Argv {
public:
    Argv(std::initializer_list<std::string> args) {
        storage.emplace_back("chamberlink_monitor");
        storage.insert(storage.end(), args.begin(), args.end());
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

auto parse(std::initializer_list<std::string> args) -> std::optional<CL::ClientOptions> {
    Argv argv{args};
    return CL::ParseClientArguments(argv.argc(), argv.argv());
}

// Keeps the caller's environment from leaking into parsing tests.
class CleanEnvironment {
public:
    CleanEnvironment() {
        for (auto const* key : {"CHAMBERLINK_BACKEND_URL", "CHAMBERLINK_SUBNETS", "CHAMBERLINK_BACKEND_PORT",
                                "CHAMBERLINK_FULL_SCAN", "CHAMBERLINK_SCAN_RANGE", "CHAMBERLINK_PROBE_TIMEOUT_MS",
                                "CHAMBERLINK_MAX_RECONNECT_ATTEMPTS", "CHAMBERLINK_CONFIRMATION_TIMEOUT_MS",
                                "CHAMBERLINK_OFFLINE", "CHAMBERLINK_CACHE_FILE"}) {
            guards.push_back(std::make_unique<EnvGuard>(key, nullptr));
        }
    }

private:
    std::vector<std::unique_ptr<EnvGuard>> guards;
};

} // namespace

TEST_SUITE("config.client_options") {

TEST_CASE("defaults parse and validate") {
    CleanEnvironment clean;
    auto             options = parse({});
    REQUIRE(options.has_value());
    CHECK(options->discovery.subnets.size() == 4);
    CHECK(options->discovery.backend_port == 8000);
    CHECK(options->discovery.quick_scan_host == 100);
    CHECK_FALSE(options->discovery.full_scan);
    CHECK(options->discovery.probe_timeout == 2000ms);
    CHECK(options->session.max_reconnect_attempts == 5);
    CHECK(options->session.discovery_reset_every == 3);
    CHECK(options->commands.confirmation_timeout == 3000ms);
    CHECK(options->commands.rate_limit_max_commands == 5);
}

TEST_CASE("flags override defaults") {
    CleanEnvironment clean;
    auto options = parse({"--subnets", "10.1.2, 10.1.3", "--port", "9000", "--full-scan", "--scan-range", "20-40",
                          "--probe-timeout-ms", "150", "--toggle", "ac", "--toggle", "intercom", "--pressure", "up"});
    REQUIRE(options.has_value());
    CHECK(options->discovery.subnets == std::vector<std::string>{"10.1.2", "10.1.3"});
    CHECK(options->discovery.backend_port == 9000);
    CHECK(options->discovery.full_scan);
    CHECK(options->discovery.scan_range_start == 20);
    CHECK(options->discovery.scan_range_end == 40);
    CHECK(options->discovery.probe_timeout == 150ms);
    CHECK(options->toggles == std::vector<std::string>{"ac", "intercom"});
    CHECK(options->pressure_step == std::optional<std::string>{"up"});
}

TEST_CASE("environment applies before flags") {
    CleanEnvironment clean;
    EnvGuard         url("CHAMBERLINK_BACKEND_URL", "http://10.0.0.7:8000");
    EnvGuard         attempts("CHAMBERLINK_MAX_RECONNECT_ATTEMPTS", "9");

    auto fromEnv = parse({});
    REQUIRE(fromEnv.has_value());
    CHECK(fromEnv->discovery.override_url == "http://10.0.0.7:8000");
    CHECK(fromEnv->session.max_reconnect_attempts == 9);

    auto flagWins = parse({"--max-reconnect-attempts", "2"});
    REQUIRE(flagWins.has_value());
    CHECK(flagWins->session.max_reconnect_attempts == 2);
}

TEST_CASE("invalid input is refused") {
    CleanEnvironment clean;
    CHECK_FALSE(parse({"--port", "70000"}).has_value());
    CHECK_FALSE(parse({"--subnets", "192.168"}).has_value());
    CHECK_FALSE(parse({"--scan-range", "40-20"}).has_value());
    CHECK_FALSE(parse({"--probe-timeout-ms"}).has_value());
    CHECK_FALSE(parse({"--backend-url", "ftp://nowhere"}).has_value());
    CHECK_FALSE(parse({"--pressure", "sideways"}).has_value());
    CHECK_FALSE(parse({"--version-pattern", "("}).has_value());
    CHECK_FALSE(parse({"--bogus"}).has_value());

    EnvGuard badEnv("CHAMBERLINK_FULL_SCAN", "maybe");
    CHECK_FALSE(parse({}).has_value());
}

TEST_CASE("help skips validation") {
    CleanEnvironment clean;
    auto options = parse({"--subnets", "", "--help"});
    REQUIRE(options.has_value());
    CHECK(options->show_help);
}

TEST_CASE("subnet prefixes need three octets") {
    CHECK(CL::IsValidSubnetPrefix("192.168.1"));
    CHECK(CL::IsValidSubnetPrefix("10.0.0"));
    CHECK_FALSE(CL::IsValidSubnetPrefix("10.0"));
    CHECK_FALSE(CL::IsValidSubnetPrefix("10.0.0.1"));
    CHECK_FALSE(CL::IsValidSubnetPrefix("10.0.256"));
    CHECK_FALSE(CL::IsValidSubnetPrefix("10..0"));
}

TEST_CASE("validation covers the reconnect and command knobs") {
    CL::ClientOptions options;
    CHECK_FALSE(CL::ValidateClientOptions(options).has_value());

    options.session.discovery_reset_every = 0;
    CHECK(CL::ValidateClientOptions(options).has_value());
    options.session.discovery_reset_every = 3;

    options.commands.poll_interval = 0ms;
    CHECK(CL::ValidateClientOptions(options).has_value());
    options.commands.poll_interval = 100ms;

    options.discovery.subnets.clear();
    CHECK(CL::ValidateClientOptions(options).has_value());
    options.discovery.override_url = "http://chamber.local:8000";
    CHECK_FALSE(CL::ValidateClientOptions(options).has_value());
}

} // TEST_SUITE
