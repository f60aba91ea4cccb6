#include "fleet_sim/route.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include "fleet_sim/errors.hpp"

namespace fleet_sim {

bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept {
    return coordinate.latitude_deg >= -90.0 && coordinate.latitude_deg <= 90.0
        && coordinate.longitude_deg >= -180.0 && coordinate.longitude_deg <= 180.0;
}

Route::Route(std::string vessel_id, std::string name, std::vector<Waypoint> waypoints)
    : str_vessel_id_(std::move(vessel_id)),
      str_name_(std::move(name)),
      list_waypoints_(std::move(waypoints)) {
    if (str_vessel_id_.empty()) {
        throw std::invalid_argument("Route requires a vessel id");
    }
    if (list_waypoints_.empty()) {
        throw std::invalid_argument(fmt::format("Route for {} has no waypoints", str_vessel_id_));
    }

    std::sort(list_waypoints_.begin(), list_waypoints_.end(), [](const Waypoint& lhs, const Waypoint& rhs) {
        return lhs.sequence < rhs.sequence;
    });

    for (std::size_t index = 0; index < list_waypoints_.size(); ++index) {
        const Waypoint& waypoint = list_waypoints_[index];
        if (!is_valid_coordinate(waypoint.location)) {
            throw std::invalid_argument(fmt::format(
                "Route for {} has out-of-range waypoint {} ({}, {})",
                str_vessel_id_,
                waypoint.sequence,
                waypoint.location.latitude_deg,
                waypoint.location.longitude_deg
            ));
        }
        if (index > 0 && list_waypoints_[index - 1].sequence == waypoint.sequence) {
            throw std::invalid_argument(fmt::format(
                "Route for {} repeats waypoint sequence {}", str_vessel_id_, waypoint.sequence
            ));
        }
    }
}

const std::string& Route::vessel_id() const noexcept {
    return str_vessel_id_;
}

const std::string& Route::name() const noexcept {
    return str_name_;
}

const std::vector<Waypoint>& Route::waypoints() const noexcept {
    return list_waypoints_;
}

std::size_t Route::size() const noexcept {
    return list_waypoints_.size();
}

const Waypoint& Route::at(std::size_t index) const {
    if (index >= list_waypoints_.size()) {
        throw std::out_of_range(fmt::format(
            "Waypoint index {} outside route of {} ({} waypoints)", index, str_vessel_id_, list_waypoints_.size()
        ));
    }
    return list_waypoints_[index];
}

std::size_t Route::next_index(std::size_t index) const noexcept {
    return (index + 1) % list_waypoints_.size();
}

bool Route::is_stationary() const noexcept {
    return list_waypoints_.size() == 1;
}

RouteTable::RouteTable(std::vector<Route> routes) {
    for (Route& route : routes) {
        std::string vessel_id = route.vessel_id();
        const auto [it, inserted] = map_routes_.emplace(std::move(vessel_id), std::move(route));
        if (!inserted) {
            throw std::invalid_argument(fmt::format("Duplicate route for vessel {}", it->first));
        }
    }
}

const Route& RouteTable::route_for(const std::string& vessel_id) const {
    const auto it = map_routes_.find(vessel_id);
    if (it == map_routes_.end()) {
        throw NotFoundError(fmt::format("No route registered for vessel {}", vessel_id));
    }
    return it->second;
}

bool RouteTable::contains(const std::string& vessel_id) const {
    return map_routes_.contains(vessel_id);
}

std::size_t RouteTable::size() const noexcept {
    return map_routes_.size();
}

}  // namespace fleet_sim
