#include "fleet_sim/navigation_engine.hpp"

#include <cmath>

#include "fleet_sim/geodesy.hpp"

namespace fleet_sim {

double NavigationEngine::distance_travelled_nm(double speed_knots, double simulated_seconds) noexcept {
    return (speed_knots / k_seconds_per_hour) * simulated_seconds;
}

double NavigationEngine::arrival_threshold_nm(double travelled_nm) noexcept {
    return k_base_arrival_threshold_nm + travelled_nm * k_arrival_travel_factor;
}

NavigationResult NavigationEngine::advance(VesselState& state, const Route& route, double simulated_seconds) const {
    NavigationResult result{};
    result.waypoint_index = state.current_waypoint_index;
    if (route.is_stationary()) {
        return result;
    }

    const double speed_knots = state.speed_knots();
    const double travelled_nm = distance_travelled_nm(speed_knots, simulated_seconds);

    std::size_t target_index = state.current_waypoint_index;
    const Waypoint* target = &route.at(target_index);
    result.distance_to_target_nm = distance_nm(state.position, target->location);

    if (result.distance_to_target_nm < arrival_threshold_nm(travelled_nm)) {
        target_index = route.next_index(target_index);
        target = &route.at(target_index);
        result.waypoint_advanced = true;
    }

    const double heading = bearing_deg(state.position, target->location);
    const double heading_rad = degrees_to_radians(heading);
    const double lat_rad = degrees_to_radians(state.position.latitude_deg);

    const double delta_lat = travelled_nm * std::cos(heading_rad) / k_nm_per_degree_latitude;
    const double delta_lon = travelled_nm * std::sin(heading_rad) / (k_nm_per_degree_latitude * std::cos(lat_rad));

    state.position.latitude_deg += delta_lat;
    state.position.longitude_deg += delta_lon;
    state.heading_deg = heading;
    state.current_waypoint_index = target_index;
    state.area_covered += travelled_nm * k_area_coverage_factor * speed_knots;

    result.distance_travelled_nm = travelled_nm;
    result.waypoint_index = target_index;
    result.moved = true;
    return result;
}

}  // namespace fleet_sim
