#include "fleet_sim/fleet_seed.hpp"

#include <initializer_list>
#include <string>

#include "fleet_sim/energy_model.hpp"

namespace fleet_sim {

namespace {

VesselState make_state(std::string vessel_id,
                       GeodeticCoordinate position,
                       double heading_deg,
                       OperatingMode mode,
                       double original_speed_knots,
                       double energy_level,
                       std::string speed_description,
                       std::string conditions) {
    VesselState state{};
    state.vessel_id = std::move(vessel_id);
    state.position = position;
    state.heading_deg = heading_deg;
    state.mode = mode;
    state.original_speed_knots = original_speed_knots;
    state.energy_level = energy_level;
    state.speed_description = std::move(speed_description);
    state.conditions = std::move(conditions);
    state.area_covered = 0.0;
    state.current_waypoint_index = 0;
    state.last_updated = SystemClock::now();
    return state;
}

std::vector<Waypoint> make_waypoints(std::initializer_list<GeodeticCoordinate> coordinates) {
    std::vector<Waypoint> waypoints{};
    waypoints.reserve(coordinates.size());
    int sequence = 0;
    for (const GeodeticCoordinate& coordinate : coordinates) {
        waypoints.push_back(Waypoint{coordinate, sequence++});
    }
    return waypoints;
}

}  // namespace

FleetSeed make_demo_fleet() {
    FleetSeed seed{};

    seed.vessels = {
        Vessel{"BOAT-001", "Contoso Sea Voyager", 24, "Multibeam Sonar, Magnetometer", "Dogger Bank Offshore Wind Farm", "Geophysical Survey"},
        Vessel{"BOAT-002", "Contoso Sea Pioneer", 18, "ROV, Side-scan Sonar", "Subsea Cable Route Survey", "ROV Operations"},
        Vessel{"BOAT-003", "Contoso Sea Navigator", 22, "CPT, Seabed Sampling", "North Sea Pipeline Inspection", "Geotechnical Survey"},
        Vessel{"BOAT-004", "Contoso Sea Explorer", 12, "Multibeam, Sub-bottom Profiler", "Scheduled Maintenance", "Standby"},
    };

    seed.states = {
        make_state("BOAT-001", {51.5074, -0.1278}, 45.0, ActiveMode{12.0}, 12.0, 85.5, "12 knots", "Good sea state"),
        make_state("BOAT-002", {51.5154, -0.1420}, 0.0, ChargingMode{}, 0.0, 42.3, EnergyModel::k_station_keeping_text, "Calm seas"),
        make_state("BOAT-003", {51.5010, -0.1200}, 135.0, ActiveMode{8.0}, 8.0, 91.2, "8 knots", "Moderate seas, 2m swell"),
        make_state("BOAT-004", {51.5090, -0.1390}, 315.0, MaintenanceMode{}, 0.0, 15.7, "Docked", "At berth"),
    };

    seed.routes.emplace_back("BOAT-001", "Rectangle Pattern - NE Quadrant", make_waypoints({
        {51.5170, -0.1278},
        {51.5250, -0.1000},
        {51.5250, -0.1400},
        {51.5170, -0.1400},
        {51.5170, -0.1278},
    }));
    seed.routes.emplace_back("BOAT-002", "Zigzag Pattern - NW Quadrant", make_waypoints({
        {51.5200, -0.1500},
        {51.5250, -0.1600},
        {51.5200, -0.1700},
        {51.5150, -0.1600},
        {51.5200, -0.1500},
    }));
    seed.routes.emplace_back("BOAT-003", "Triangle Pattern - South Quadrant", make_waypoints({
        {51.4950, -0.1200},
        {51.5050, -0.1100},
        {51.5050, -0.1300},
        {51.4950, -0.1200},
    }));
    seed.routes.emplace_back("BOAT-004", "Docked Position (Maintenance)", make_waypoints({
        {51.5090, -0.1390},
    }));

    return seed;
}

}  // namespace fleet_sim
