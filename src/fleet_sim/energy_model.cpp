#include "fleet_sim/energy_model.hpp"

#include <algorithm>
#include <variant>

#include <fmt/format.h>

#include "fleet_sim/geodesy.hpp"

namespace fleet_sim {

double EnergyModel::drain_percent(double speed_knots, double simulated_seconds) noexcept {
    const double speed_factor = speed_knots / k_reference_speed_knots;
    return k_drain_coefficient * speed_factor * speed_factor * simulated_seconds;
}

double EnergyModel::charge_percent(double simulated_seconds) noexcept {
    return k_charge_rate_percent_per_s * simulated_seconds;
}

ModeTransition EnergyModel::apply(VesselState& state, const Route& route, double simulated_seconds) const {
    if (std::holds_alternative<ActiveMode>(state.mode)) {
        return apply_active(state, simulated_seconds);
    }
    if (std::holds_alternative<ChargingMode>(state.mode)) {
        return apply_charging(state, route, simulated_seconds);
    }
    return ModeTransition::None;
}

ModeTransition EnergyModel::apply_active(VesselState& state, double simulated_seconds) const {
    const double drain = drain_percent(state.speed_knots(), simulated_seconds);
    state.energy_level = std::clamp(state.energy_level - drain, k_min_energy, k_max_energy);

    if (state.energy_level >= k_low_energy_threshold) {
        return ModeTransition::None;
    }
    state.mode = ChargingMode{};
    state.speed_description = k_station_keeping_text;
    state.conditions = k_solar_charging_conditions;
    return ModeTransition::EnteredCharging;
}

ModeTransition EnergyModel::apply_charging(VesselState& state, const Route& route, double simulated_seconds) const {
    state.energy_level = std::clamp(state.energy_level + charge_percent(simulated_seconds), k_min_energy, k_max_energy);

    if (state.energy_level < k_resume_energy_threshold) {
        state.speed_description = k_station_keeping_text;
        return ModeTransition::None;
    }
    const Waypoint& target = route.at(state.current_waypoint_index);
    state.mode = ActiveMode{state.original_speed_knots};
    state.heading_deg = bearing_deg(state.position, target.location);
    state.speed_description = fmt::format("{:.0f} knots", state.original_speed_knots);
    return ModeTransition::ResumedActive;
}

std::string_view to_string(ModeTransition transition) noexcept {
    switch (transition) {
        case ModeTransition::None:
            return "none";
        case ModeTransition::EnteredCharging:
            return "entered_charging";
        case ModeTransition::ResumedActive:
            return "resumed_active";
    }
    return "unknown";
}

}  // namespace fleet_sim
