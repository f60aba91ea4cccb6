// === Energy Model ============================================================
//
// Battery bookkeeping and the Active/Charging/Maintenance state machine.
// Active vessels drain quadratically with speed and drop into Charging below
// 20%; Charging vessels recharge from solar at a fixed rate and resume their
// cruising speed at 75%. Maintenance is a sink the tick process never enters
// or leaves on its own.

#pragma once

#include <string_view>

#include "fleet_sim/route.hpp"
#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

/** @brief Mode change produced by one energy step. */
enum class ModeTransition {
    None,               /**< Mode unchanged. */
    EnteredCharging,    /**< Active vessel fell below the low-energy threshold. */
    ResumedActive       /**< Charging vessel reached the resume threshold. */
};

/** @brief Stateless energy rules applied to one vessel state row. */
class EnergyModel final {
  public:
    static constexpr double k_drain_coefficient{0.008};        /**< Percent per simulated second at the reference speed. */
    static constexpr double k_reference_speed_knots{10.0};
    static constexpr double k_charge_rate_percent_per_s{0.083}; /**< Roughly 5% per simulated minute. */
    static constexpr double k_low_energy_threshold{20.0};
    static constexpr double k_resume_energy_threshold{75.0};
    static constexpr double k_min_energy{0.0};
    static constexpr double k_max_energy{100.0};

    static constexpr char k_station_keeping_text[] = "Station keeping";
    static constexpr char k_solar_charging_conditions[] = "Charging via solar panels";

    /** @brief Battery percentage consumed at @p speed_knots over @p simulated_seconds. */
    [[nodiscard]] static double drain_percent(double speed_knots, double simulated_seconds) noexcept;
    /** @brief Battery percentage recovered over @p simulated_seconds of charging. */
    [[nodiscard]] static double charge_percent(double simulated_seconds) noexcept;

    /**
     * @brief Apply one energy step and any resulting mode transition.
     *
     * @p route is used to point a resuming vessel at its current waypoint.
     * Maintenance states are returned untouched.
     */
    ModeTransition apply(VesselState& state, const Route& route, double simulated_seconds) const;

  private:
    ModeTransition apply_active(VesselState& state, double simulated_seconds) const;
    ModeTransition apply_charging(VesselState& state, const Route& route, double simulated_seconds) const;
};

[[nodiscard]] std::string_view to_string(ModeTransition transition) noexcept;

}  // namespace fleet_sim
