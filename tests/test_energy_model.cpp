#include <catch2/catch.hpp>

#include "fleet_sim/energy_model.hpp"
#include "fleet_sim/geodesy.hpp"

using namespace fleet_sim;

namespace {

Route make_triangle_route() {
    return Route{"BOAT-003", "Triangle", {
        Waypoint{{51.4950, -0.1200}, 0},
        Waypoint{{51.5050, -0.1100}, 1},
        Waypoint{{51.5050, -0.1300}, 2},
    }};
}

VesselState make_state(OperatingMode mode, double original_speed_knots, double energy_level) {
    VesselState state{};
    state.vessel_id = "BOAT-003";
    state.position = GeodeticCoordinate{51.5010, -0.1200};
    state.heading_deg = 135.0;
    state.mode = mode;
    state.original_speed_knots = original_speed_knots;
    state.energy_level = energy_level;
    state.speed_description = "8 knots";
    state.conditions = "Moderate seas, 2m swell";
    state.current_waypoint_index = 1;
    return state;
}

}  // namespace

TEST_CASE("Drain grows with the square of speed") {
    REQUIRE(EnergyModel::drain_percent(12.0, 1.0) == Approx(0.01152));
    REQUIRE(EnergyModel::drain_percent(10.0, 1.0) == Approx(0.008));
    REQUIRE(EnergyModel::drain_percent(20.0, 1.0) == Approx(4.0 * EnergyModel::drain_percent(10.0, 1.0)));
    REQUIRE(EnergyModel::drain_percent(0.0, 5.0) == Approx(0.0));
    REQUIRE(EnergyModel::charge_percent(60.0) == Approx(4.98));
}

TEST_CASE("Active vessel drains without changing mode above the threshold") {
    const Route route = make_triangle_route();
    VesselState state = make_state(ActiveMode{12.0}, 12.0, 85.5);
    const EnergyModel model{};

    const ModeTransition transition = model.apply(state, route, 1.0);

    REQUIRE(transition == ModeTransition::None);
    REQUIRE(state.energy_level == Approx(85.5 - 0.01152));
    REQUIRE(state.status() == VesselStatus::Active);
    REQUIRE(state.speed_knots() == Approx(12.0));
}

TEST_CASE("Active vessel below the low threshold switches to charging") {
    const Route route = make_triangle_route();
    VesselState state = make_state(ActiveMode{8.0}, 8.0, 20.001);
    const EnergyModel model{};

    const ModeTransition transition = model.apply(state, route, 1.0);

    REQUIRE(transition == ModeTransition::EnteredCharging);
    REQUIRE(state.status() == VesselStatus::Charging);
    REQUIRE(state.speed_knots() == Approx(0.0));
    REQUIRE(state.original_speed_knots == Approx(8.0));
    REQUIRE(state.speed_description == EnergyModel::k_station_keeping_text);
    REQUIRE(state.conditions == EnergyModel::k_solar_charging_conditions);
}

TEST_CASE("Energy is clamped into [0, 100]") {
    const Route route = make_triangle_route();
    const EnergyModel model{};

    VesselState draining = make_state(ActiveMode{10.0}, 10.0, 0.001);
    model.apply(draining, route, 10.0);
    REQUIRE(draining.energy_level == Approx(0.0));

    VesselState charging = make_state(ChargingMode{}, 10.0, 99.99);
    model.apply(charging, route, 10.0);
    REQUIRE(charging.energy_level == Approx(100.0));
}

TEST_CASE("Charging vessel keeps station until the resume threshold") {
    const Route route = make_triangle_route();
    VesselState state = make_state(ChargingMode{}, 8.0, 42.3);
    const EnergyModel model{};

    const ModeTransition transition = model.apply(state, route, 1.0);

    REQUIRE(transition == ModeTransition::None);
    REQUIRE(state.status() == VesselStatus::Charging);
    REQUIRE(state.energy_level == Approx(42.383));
    REQUIRE(state.speed_description == EnergyModel::k_station_keeping_text);
}

TEST_CASE("Charging vessel resumes its original speed toward the current waypoint") {
    const Route route = make_triangle_route();
    VesselState state = make_state(ChargingMode{}, 8.0, 74.95);
    const EnergyModel model{};

    const ModeTransition transition = model.apply(state, route, 1.0);

    REQUIRE(transition == ModeTransition::ResumedActive);
    REQUIRE(state.status() == VesselStatus::Active);
    REQUIRE(state.speed_knots() == Approx(8.0));
    REQUIRE(state.speed_description == "8 knots");
    REQUIRE(state.heading_deg == Approx(bearing_deg(state.position, route.at(1).location)));
    REQUIRE(state.current_waypoint_index == 1);
}

TEST_CASE("A vessel changes mode at most once per step") {
    const Route route = make_triangle_route();
    VesselState state = make_state(ActiveMode{10.0}, 10.0, 20.0005);
    const EnergyModel model{};

    // A large budget would cross both thresholds if the rules chained.
    const ModeTransition transition = model.apply(state, route, 1'000.0);

    REQUIRE(transition == ModeTransition::EnteredCharging);
    REQUIRE(state.status() == VesselStatus::Charging);
}

TEST_CASE("Maintenance vessels are left untouched") {
    const Route route = make_triangle_route();
    VesselState state = make_state(MaintenanceMode{}, 0.0, 15.7);
    const VesselState before = state;
    const EnergyModel model{};

    REQUIRE(model.apply(state, route, 5.0) == ModeTransition::None);
    REQUIRE(state == before);
}

TEST_CASE("Mode transitions have stable names") {
    REQUIRE(to_string(ModeTransition::None) == "none");
    REQUIRE(to_string(ModeTransition::EnteredCharging) == "entered_charging");
    REQUIRE(to_string(ModeTransition::ResumedActive) == "resumed_active");
}
