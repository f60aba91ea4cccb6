#include "fleet_sim/vessel_simulator.hpp"

#include <variant>

namespace fleet_sim {

VesselStep VesselSimulator::step(const VesselState& current, const Route& route, const TickContext& context) const {
    VesselStep result{};
    result.navigation.waypoint_index = current.current_waypoint_index;

    if (std::holds_alternative<MaintenanceMode>(current.mode)) {
        return result;
    }
    if (std::holds_alternative<ActiveMode>(current.mode) && route.is_stationary()) {
        return result;
    }

    VesselState next_state = current;
    if (std::holds_alternative<ActiveMode>(next_state.mode)) {
        result.navigation = navigation_engine_.advance(next_state, route, context.simulated_seconds);
    }
    result.transition = energy_model_.apply(next_state, route, context.simulated_seconds);
    next_state.last_updated = context.timestamp;

    result.next_state = std::move(next_state);
    return result;
}

}  // namespace fleet_sim
