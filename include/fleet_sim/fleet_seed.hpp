// === Fleet Seed ==============================================================
//
// Seed bundle used to populate a state store: vessel metadata, their initial
// state rows and their survey routes. `make_demo_fleet` reproduces the four
// survey vessels operating off the Thames estuary demo area.

#pragma once

#include <vector>

#include "fleet_sim/route.hpp"
#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

/** @brief Metadata, initial states and routes for a whole fleet. */
struct FleetSeed final {
    std::vector<Vessel> vessels{};
    std::vector<VesselState> states{};
    std::vector<Route> routes{};
};

/** @brief The four-vessel demo fleet with its rectangle, zigzag, triangle and docked routes. */
[[nodiscard]] FleetSeed make_demo_fleet();

}  // namespace fleet_sim
