#include <catch2/catch.hpp>

#include "fleet_sim/vessel_simulator.hpp"

using namespace fleet_sim;

namespace {

Route make_zigzag_route() {
    return Route{"BOAT-002", "Zigzag", {
        Waypoint{{51.5200, -0.1500}, 0},
        Waypoint{{51.5250, -0.1600}, 1},
        Waypoint{{51.5200, -0.1700}, 2},
    }};
}

TickContext make_context(double speed_multiplier) {
    TickContext context{};
    context.tick_number = 7;
    context.speed_multiplier = speed_multiplier;
    context.simulated_seconds = speed_multiplier;
    context.timestamp = Timestamp{std::chrono::seconds{1'700'000'000}};
    return context;
}

VesselState make_state(OperatingMode mode, double energy_level) {
    VesselState state{};
    state.vessel_id = "BOAT-002";
    state.position = GeodeticCoordinate{51.5154, -0.1420};
    state.mode = mode;
    state.original_speed_knots = 10.0;
    state.energy_level = energy_level;
    state.speed_description = "10 knots";
    state.conditions = "Calm seas";
    return state;
}

}  // namespace

TEST_CASE("Active vessels move, drain and get stamped") {
    const VesselSimulator simulator{};
    const VesselState current = make_state(ActiveMode{10.0}, 80.0);

    const VesselStep step = simulator.step(current, make_zigzag_route(), make_context(2.0));

    REQUIRE(step.next_state.has_value());
    REQUIRE(step.navigation.moved);
    REQUIRE(step.transition == ModeTransition::None);
    REQUIRE(step.next_state->position != current.position);
    REQUIRE(step.next_state->energy_level == Approx(80.0 - 0.016));
    REQUIRE(step.next_state->area_covered > 0.0);
    REQUIRE(step.next_state->last_updated == make_context(2.0).timestamp);
}

TEST_CASE("Charging vessels recharge in place") {
    const VesselSimulator simulator{};
    const VesselState current = make_state(ChargingMode{}, 42.3);

    const VesselStep step = simulator.step(current, make_zigzag_route(), make_context(1.0));

    REQUIRE(step.next_state.has_value());
    REQUIRE_FALSE(step.navigation.moved);
    REQUIRE(step.next_state->position == current.position);
    REQUIRE(step.next_state->energy_level == Approx(42.383));
    REQUIRE(step.next_state->status() == VesselStatus::Charging);
}

TEST_CASE("A vessel that resumes this tick does not move until the next one") {
    const VesselSimulator simulator{};
    const VesselState current = make_state(ChargingMode{}, 74.99);

    const VesselStep step = simulator.step(current, make_zigzag_route(), make_context(1.0));

    REQUIRE(step.transition == ModeTransition::ResumedActive);
    REQUIRE(step.next_state->status() == VesselStatus::Active);
    REQUIRE(step.next_state->position == current.position);
}

TEST_CASE("Maintenance vessels are skipped") {
    const VesselSimulator simulator{};
    const VesselState current = make_state(MaintenanceMode{}, 15.7);

    const VesselStep step = simulator.step(current, make_zigzag_route(), make_context(1.0));

    REQUIRE_FALSE(step.next_state.has_value());
    REQUIRE(step.transition == ModeTransition::None);
}

TEST_CASE("Active vessels on a single-waypoint route are skipped") {
    const VesselSimulator simulator{};
    const Route docked{"BOAT-002", "Docked", {Waypoint{{51.5154, -0.1420}, 0}}};
    const VesselState current = make_state(ActiveMode{10.0}, 60.0);

    const VesselStep step = simulator.step(current, docked, make_context(1.0));

    REQUIRE_FALSE(step.next_state.has_value());
    REQUIRE_FALSE(step.navigation.moved);
}

TEST_CASE("Charging vessels on a single-waypoint route still recharge") {
    const VesselSimulator simulator{};
    const Route docked{"BOAT-002", "Docked", {Waypoint{{51.5154, -0.1420}, 0}}};
    const VesselState current = make_state(ChargingMode{}, 50.0);

    const VesselStep step = simulator.step(current, docked, make_context(1.0));

    REQUIRE(step.next_state.has_value());
    REQUIRE(step.next_state->energy_level == Approx(50.083));
}
