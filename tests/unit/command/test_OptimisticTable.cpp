#include <doctest/doctest.h>

#include "command/OptimisticTable.hpp"

#include <cstdint>
#include <functional>

using CL::OptimisticTable;
using json = nlohmann::json;

namespace {

auto at(std::uint64_t sequence) -> std::function<std::uint64_t()> {
    return [sequence] { return sequence; };
}

} // namespace

TEST_SUITE("command.optimistic_table") {

TEST_CASE("recording the same key twice supersedes") {
    OptimisticTable table;
    auto const      first  = table.record("ac", true, "ac_1", at(4)).generation;
    auto const      second = table.record("ac", true, "ac_2", at(5)).generation;

    CHECK(second > first);
    CHECK(table.size() == 1);
    CHECK_FALSE(table.isCurrent("ac", first));
    CHECK(table.isCurrent("ac", second));

    auto entry = table.entry("ac");
    REQUIRE(entry.has_value());
    CHECK(entry->command_id == "ac_2");
    CHECK(entry->baseline_sequence == 5);
}

TEST_CASE("stale generations cannot touch the successor") {
    OptimisticTable table;
    auto const      stale   = table.record("intercom", true, "intercom_1", at(0)).generation;
    auto const      current = table.record("intercom", false, "intercom_2", at(0)).generation;

    CHECK_FALSE(table.adopt("intercom", stale, json(true)));
    CHECK_FALSE(table.remove("intercom", stale));
    CHECK_FALSE(table.linger("intercom", stale, 3));
    CHECK(table.value("intercom", 0).value_or(json{}) == json(false));

    CHECK(table.remove("intercom", current));
    CHECK_FALSE(table.isPending("intercom"));
    CHECK_FALSE(table.value("intercom", 0).has_value());
}

TEST_CASE("adopt replaces the shown value") {
    OptimisticTable table;
    auto const      generation = table.record("pressure_setpoint", 1.6, "pressure_setpoint_1", at(0)).generation;
    CHECK(table.adopt("pressure_setpoint", generation, json(1.59)));
    CHECK(table.value("pressure_setpoint", 0)->get<double>() == doctest::Approx(1.59));
}

TEST_CASE("lingering value lasts until a newer snapshot") {
    OptimisticTable table;
    auto const      generation = table.record("ac", true, "ac_1", at(2)).generation;
    REQUIRE(table.linger("ac", generation, 7));

    CHECK_FALSE(table.isPending("ac"));
    CHECK(table.value("ac", 7).value_or(json{}) == json(true));
    CHECK_FALSE(table.value("ac", 8).has_value());

    SUBCASE("a new command clears it") {
        table.record("ac", false, "ac_2", at(7));
        auto const next = table.entry("ac");
        REQUIRE(next.has_value());
        CHECK(table.remove("ac", next->generation));
        CHECK_FALSE(table.value("ac", 0).has_value());
    }
}

TEST_CASE("record reports the baseline it stored") {
    OptimisticTable table;
    int             reads    = 0;
    auto const      recorded = table.record("ac", true, "ac_1", [&] {
        ++reads;
        return std::uint64_t{9};
    });
    CHECK(reads == 1);
    CHECK(recorded.baseline == 9);
    REQUIRE(table.entry("ac").has_value());
    CHECK(table.entry("ac")->baseline_sequence == 9);
    CHECK(table.entry("ac")->generation == recorded.generation);
}

TEST_CASE("pending lists entries in issue order") {
    OptimisticTable table;
    table.record("reading_lights", true, "reading_lights_1", at(0));
    table.record("ac", true, "ac_2", at(0));
    table.record("door_lights", true, "door_lights_3", at(0));

    auto pending = table.pending();
    REQUIRE(pending.size() == 3);
    CHECK(pending[0].control_key == "reading_lights");
    CHECK(pending[1].control_key == "ac");
    CHECK(pending[2].control_key == "door_lights");
}

} // TEST_SUITE
