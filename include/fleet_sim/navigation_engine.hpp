// === Navigation Engine =======================================================
//
// Advances an Active vessel toward the current waypoint of its route for one
// simulated-seconds budget. Arrival is decided before moving, against a
// threshold that grows with the distance covered per tick so that high speed
// multipliers never overshoot a waypoint while low speeds still register
// arrival. Movement uses a local flat-earth approximation that is only valid
// at the few-nautical-mile scale of the survey routes.

#pragma once

#include <cstddef>

#include "fleet_sim/route.hpp"
#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

/**
 * @brief Outcome of a single navigation step.
 */
struct NavigationResult final {
    double distance_travelled_nm{};  /**< Distance covered during the step. */
    double distance_to_target_nm{};  /**< Distance to the original target, measured before moving. */
    bool waypoint_advanced{};        /**< True when the arrival test fired. */
    std::size_t waypoint_index{};    /**< Target index after the step. */
    bool moved{};                    /**< False for stationary routes. */
};

/** @brief Stateless navigation rules applied to one vessel state row. */
class NavigationEngine final {
  public:
    static constexpr double k_seconds_per_hour{3'600.0};
    static constexpr double k_base_arrival_threshold_nm{0.15};
    static constexpr double k_arrival_travel_factor{1.5};
    static constexpr double k_nm_per_degree_latitude{60.0};
    static constexpr double k_area_coverage_factor{0.05};

    /** @brief Nautical miles covered at @p speed_knots over @p simulated_seconds. */
    [[nodiscard]] static double distance_travelled_nm(double speed_knots, double simulated_seconds) noexcept;
    /** @brief Arrival radius for a step that covers @p travelled_nm. */
    [[nodiscard]] static double arrival_threshold_nm(double travelled_nm) noexcept;

    /**
     * @brief Move @p state toward its current waypoint.
     *
     * Updates position, heading, current waypoint index and area covered.
     * The caller guarantees the state is Active and its waypoint index is
     * valid for @p route. Stationary routes leave the state untouched.
     */
    NavigationResult advance(VesselState& state, const Route& route, double simulated_seconds) const;
};

}  // namespace fleet_sim
