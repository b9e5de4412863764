#include <doctest/doctest.h>

#include "session/ReconnectPolicy.hpp"

using namespace std::chrono_literals;

TEST_SUITE("session.reconnect_policy") {

TEST_CASE("every third attempt resets discovery") {
    CL::SessionOptions options;
    options.max_reconnect_attempts = 5;
    options.reconnect_interval     = 250ms;
    options.discovery_reset_every  = 3;
    CL::ReconnectPolicy policy{options};

    bool const expected[] = {false, false, true, false, false};
    for (int attempt = 1; attempt <= 5; ++attempt) {
        auto decision = policy.next();
        CHECK(decision.attempt == attempt);
        CHECK_FALSE(decision.exhausted);
        CHECK(decision.delay == 250ms);
        CHECK(decision.reset_discovery == expected[attempt - 1]);
    }

    auto last = policy.next();
    CHECK(last.exhausted);
    CHECK(last.attempt == 6);
}

TEST_CASE("reset starts counting again") {
    CL::SessionOptions options;
    options.max_reconnect_attempts = 1;
    CL::ReconnectPolicy policy{options};

    CHECK_FALSE(policy.next().exhausted);
    CHECK(policy.next().exhausted);
    policy.reset();
    CHECK(policy.attempts() == 0);
    CHECK_FALSE(policy.next().exhausted);
}

TEST_CASE("zero attempts gives up at once") {
    CL::SessionOptions options;
    options.max_reconnect_attempts = 0;
    CL::ReconnectPolicy policy{options};
    CHECK(policy.next().exhausted);
    CHECK(policy.maxAttempts() == 0);
}

} // TEST_SUITE
