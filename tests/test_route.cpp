#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

#include "fleet_sim/errors.hpp"
#include "fleet_sim/route.hpp"

using namespace fleet_sim;

TEST_CASE("Route orders waypoints by sequence and wraps the next index") {
    const Route route{"BOAT-X", "Test", {
        Waypoint{{51.52, -0.10}, 2},
        Waypoint{{51.50, -0.12}, 0},
        Waypoint{{51.51, -0.11}, 1},
    }};

    REQUIRE(route.size() == 3);
    REQUIRE(route.at(0).sequence == 0);
    REQUIRE(route.at(2).location == GeodeticCoordinate{51.52, -0.10});
    REQUIRE(route.next_index(0) == 1);
    REQUIRE(route.next_index(2) == 0);
    REQUIRE_FALSE(route.is_stationary());
    REQUIRE_THROWS_AS(route.at(3), std::out_of_range);
}

TEST_CASE("Route rejects empty lists, repeated sequences and bad coordinates") {
    REQUIRE_THROWS_AS(Route("BOAT-X", "Empty", {}), std::invalid_argument);
    REQUIRE_THROWS_AS(Route("BOAT-X", "Repeat", {Waypoint{{0.0, 0.0}, 1}, Waypoint{{0.1, 0.1}, 1}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Route("BOAT-X", "Latitude", {Waypoint{{91.0, 0.0}, 0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(Route("BOAT-X", "Longitude", {Waypoint{{0.0, -180.5}, 0}}), std::invalid_argument);
}

TEST_CASE("Single-waypoint routes are stationary") {
    const Route route{"BOAT-X", "Docked", {Waypoint{{51.509, -0.139}, 0}}};

    REQUIRE(route.is_stationary());
    REQUIRE(route.next_index(0) == 0);
}

TEST_CASE("RouteTable looks routes up by vessel id") {
    std::vector<Route> routes{};
    routes.emplace_back("BOAT-A", "A", std::vector<Waypoint>{Waypoint{{1.0, 1.0}, 0}});
    routes.emplace_back("BOAT-B", "B", std::vector<Waypoint>{Waypoint{{2.0, 2.0}, 0}, Waypoint{{2.1, 2.0}, 1}});
    const RouteTable table{std::move(routes)};

    REQUIRE(table.size() == 2);
    REQUIRE(table.contains("BOAT-B"));
    REQUIRE(table.route_for("BOAT-B").size() == 2);
    REQUIRE_THROWS_AS(table.route_for("BOAT-Z"), NotFoundError);
}

TEST_CASE("RouteTable rejects two routes for one vessel") {
    std::vector<Route> routes{};
    routes.emplace_back("BOAT-A", "first", std::vector<Waypoint>{Waypoint{{1.0, 1.0}, 0}});
    routes.emplace_back("BOAT-A", "second", std::vector<Waypoint>{Waypoint{{1.0, 1.0}, 0}});

    REQUIRE_THROWS_AS(RouteTable{std::move(routes)}, std::invalid_argument);
}
