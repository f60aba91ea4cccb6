#include <stdexcept>

#include <catch2/catch.hpp>

#include "fleet_sim/fleet_event_bus.hpp"

using namespace fleet_sim;

TEST_CASE("FleetEventBus delivers events in publication order") {
    FleetEventBus bus{};
    bus.publish(FleetEvent{FleetEventKind::WaypointReached, "BOAT-001", "waypoint 0 -> 1", 3});
    bus.publish(FleetEvent{FleetEventKind::ChargingStarted, "BOAT-003", "energy 19.99%", 4});

    REQUIRE(bus.pending() == 2);
    const auto first = bus.try_consume();
    REQUIRE(first.has_value());
    REQUIRE(first->kind == FleetEventKind::WaypointReached);
    REQUIRE(first->tick_number == 3);

    const auto remaining = bus.drain();
    REQUIRE(remaining.size() == 1);
    REQUIRE(remaining.front().vessel_id == "BOAT-003");
    REQUIRE_FALSE(bus.try_consume().has_value());
}

TEST_CASE("FleetEventBus drops the oldest event when full") {
    FleetEventBus bus{2};
    bus.publish(FleetEvent{FleetEventKind::WaypointReached, "BOAT-001", {}, 1});
    bus.publish(FleetEvent{FleetEventKind::WaypointReached, "BOAT-002", {}, 2});
    bus.publish(FleetEvent{FleetEventKind::FleetReset, {}, {}, 0});

    REQUIRE(bus.pending() == 2);
    REQUIRE(bus.dropped() == 1);
    REQUIRE(bus.try_consume()->vessel_id == "BOAT-002");
    REQUIRE(bus.try_consume()->kind == FleetEventKind::FleetReset);
}

TEST_CASE("FleetEventBus requires a positive capacity") {
    REQUIRE_THROWS_AS(FleetEventBus{0}, std::invalid_argument);
    REQUIRE(to_string(FleetEventKind::PersistenceFailure) == "persistence_failure");
}
