// === Survey Routes ===========================================================
//
// Static, ordered waypoint lists assigned to each vessel at seed time. Routes
// are validated on construction and are read-only afterwards; navigation
// cycles through them using modulo wraparound.

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/**
 * @brief A single geographic point in a vessel's survey route.
 */
struct Waypoint final {
    GeodeticCoordinate location{};  /**< Waypoint position. */
    int sequence{};                 /**< Order index, unique within a route. */
};

/**
 * @brief Immutable, non-empty ordered sequence of waypoints for one vessel.
 */
class Route final {
  public:
    /**
     * @brief Validate and order the supplied waypoints.
     *
     * Waypoints are sorted by sequence. Throws std::invalid_argument when the
     * list is empty, a sequence repeats, or a coordinate is out of range.
     */
    Route(std::string vessel_id, std::string name, std::vector<Waypoint> waypoints);

    [[nodiscard]] const std::string& vessel_id() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const std::vector<Waypoint>& waypoints() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /** @brief Waypoint at a route index; throws std::out_of_range when invalid. */
    [[nodiscard]] const Waypoint& at(std::size_t index) const;
    /** @brief Index that follows @p index, wrapping back to the first waypoint. */
    [[nodiscard]] std::size_t next_index(std::size_t index) const noexcept;
    /** @brief True when the route holds a single waypoint. */
    [[nodiscard]] bool is_stationary() const noexcept;

  private:
    std::string str_vessel_id_;
    std::string str_name_;
    std::vector<Waypoint> list_waypoints_;
};

/**
 * @brief Read-only lookup of routes keyed by vessel id.
 */
class RouteTable final {
  public:
    RouteTable() = default;
    explicit RouteTable(std::vector<Route> routes);

    /** @brief Route for a vessel; throws NotFoundError when absent. */
    [[nodiscard]] const Route& route_for(const std::string& vessel_id) const;
    [[nodiscard]] bool contains(const std::string& vessel_id) const;
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    std::map<std::string, Route> map_routes_;
};

/** @brief True when the coordinate lies within latitude/longitude bounds. */
[[nodiscard]] bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept;

}  // namespace fleet_sim
