#include <vector>

#include <catch2/catch.hpp>

#include "fleet_sim/geodesy.hpp"
#include "fleet_sim/navigation_engine.hpp"

using namespace fleet_sim;

namespace {

Route make_rectangle_route() {
    return Route{"BOAT-001", "Rectangle", {
        Waypoint{{51.5170, -0.1278}, 0},
        Waypoint{{51.5250, -0.1000}, 1},
        Waypoint{{51.5250, -0.1400}, 2},
        Waypoint{{51.5170, -0.1400}, 3},
        Waypoint{{51.5170, -0.1278}, 4},
    }};
}

VesselState make_active_state(GeodeticCoordinate position, double speed_knots, std::size_t waypoint_index) {
    VesselState state{};
    state.vessel_id = "BOAT-001";
    state.position = position;
    state.heading_deg = 45.0;
    state.mode = ActiveMode{speed_knots};
    state.original_speed_knots = speed_knots;
    state.energy_level = 85.5;
    state.speed_description = "12 knots";
    state.current_waypoint_index = waypoint_index;
    return state;
}

}  // namespace

TEST_CASE("Travel distance and arrival threshold scale with the simulated seconds") {
    REQUIRE(NavigationEngine::distance_travelled_nm(12.0, 1.0) == Approx(12.0 / 3'600.0));
    REQUIRE(NavigationEngine::distance_travelled_nm(12.0, 2.0) == Approx(2.0 * 12.0 / 3'600.0));
    REQUIRE(NavigationEngine::arrival_threshold_nm(12.0 / 3'600.0) == Approx(0.155));
    REQUIRE(NavigationEngine::arrival_threshold_nm(0.0) == Approx(0.15));
}

TEST_CASE("Vessel far from its waypoint steers toward it without advancing") {
    const Route route = make_rectangle_route();
    VesselState state = make_active_state({51.5074, -0.1278}, 12.0, 0);
    const NavigationEngine engine{};

    const NavigationResult result = engine.advance(state, route, 1.0);

    REQUIRE(result.moved);
    REQUIRE_FALSE(result.waypoint_advanced);
    REQUIRE(result.waypoint_index == 0);
    REQUIRE(result.distance_to_target_nm > 0.5);
    REQUIRE(result.distance_travelled_nm == Approx(12.0 / 3'600.0));
    REQUIRE(state.current_waypoint_index == 0);
    REQUIRE(state.heading_deg == Approx(0.0).margin(1e-9));
    REQUIRE(state.position.latitude_deg == Approx(51.5074 + (12.0 / 3'600.0) / 60.0).epsilon(1e-12));
    REQUIRE(state.position.longitude_deg == Approx(-0.1278).margin(1e-9));
    REQUIRE(state.area_covered == Approx((12.0 / 3'600.0) * 0.05 * 12.0));
}

TEST_CASE("Doubling the simulated seconds doubles the distance travelled") {
    const Route route = make_rectangle_route();
    VesselState single_speed = make_active_state({51.5074, -0.1278}, 12.0, 0);
    VesselState double_speed = single_speed;
    const NavigationEngine engine{};

    const NavigationResult single_result = engine.advance(single_speed, route, 1.0);
    const NavigationResult double_result = engine.advance(double_speed, route, 2.0);

    REQUIRE(double_result.distance_travelled_nm == Approx(2.0 * single_result.distance_travelled_nm));
    const double single_delta = single_speed.position.latitude_deg - 51.5074;
    const double double_delta = double_speed.position.latitude_deg - 51.5074;
    REQUIRE(double_delta == Approx(2.0 * single_delta));
}

TEST_CASE("Vessel within the arrival threshold advances and heads for the next waypoint") {
    const Route route = make_rectangle_route();
    const GeodeticCoordinate near_first{51.5169, -0.1278};
    VesselState state = make_active_state(near_first, 12.0, 0);
    const NavigationEngine engine{};

    const NavigationResult result = engine.advance(state, route, 1.0);

    REQUIRE(result.waypoint_advanced);
    REQUIRE(result.waypoint_index == 1);
    REQUIRE(state.current_waypoint_index == 1);
    REQUIRE(state.heading_deg == Approx(bearing_deg(near_first, route.at(1).location)));
}

TEST_CASE("Arrival at the last waypoint wraps back to the first") {
    const Route route = make_rectangle_route();
    VesselState state = make_active_state({51.5171, -0.1279}, 12.0, 4);
    const NavigationEngine engine{};

    const NavigationResult result = engine.advance(state, route, 1.0);

    REQUIRE(result.waypoint_advanced);
    REQUIRE(state.current_waypoint_index == 0);
}

TEST_CASE("Stationary routes leave the state untouched") {
    const Route route{"BOAT-004", "Docked", {Waypoint{{51.5090, -0.1390}, 0}}};
    VesselState state = make_active_state({51.5090, -0.1390}, 5.0, 0);
    const VesselState before = state;
    const NavigationEngine engine{};

    const NavigationResult result = engine.advance(state, route, 1.0);

    REQUIRE_FALSE(result.moved);
    REQUIRE(state == before);
}

TEST_CASE("Area covered never decreases over many steps") {
    const Route route = make_rectangle_route();
    VesselState state = make_active_state({51.5074, -0.1278}, 12.0, 0);
    const NavigationEngine engine{};

    double previous_area = state.area_covered;
    for (int step = 0; step < 500; ++step) {
        engine.advance(state, route, 10.0);
        REQUIRE(state.area_covered >= previous_area);
        REQUIRE(state.current_waypoint_index < route.size());
        REQUIRE(state.heading_deg >= 0.0);
        REQUIRE(state.heading_deg < 360.0);
        previous_area = state.area_covered;
    }
}
