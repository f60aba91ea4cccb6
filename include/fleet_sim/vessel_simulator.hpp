// === Vessel Simulator ========================================================
//
// Composes navigation and energy rules into the per-vessel tick. A vessel is
// advanced according to the mode it held at the start of the tick, so it can
// change mode at most once per tick: Active vessels move then drain, Charging
// vessels only recharge, Maintenance vessels are skipped.

#pragma once

#include <optional>

#include "fleet_sim/energy_model.hpp"
#include "fleet_sim/navigation_engine.hpp"
#include "fleet_sim/route.hpp"
#include "fleet_sim/simulation_clock.hpp"
#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

/**
 * @brief Result of advancing one vessel by one tick.
 */
struct VesselStep final {
    std::optional<VesselState> next_state{};           /**< Row to persist; empty when the vessel was skipped. */
    NavigationResult navigation{};                     /**< Navigation outcome for Active vessels. */
    ModeTransition transition{ModeTransition::None};   /**< Mode change, if any. */
};

/** @brief Applies the navigation and energy rules to a single vessel. */
class VesselSimulator final {
  public:
    /**
     * @brief Compute the next state of @p current for the tick in @p context.
     *
     * @p current is not modified. Maintenance vessels and Active vessels on a
     * stationary route yield an empty @c next_state.
     */
    [[nodiscard]] VesselStep step(const VesselState& current, const Route& route, const TickContext& context) const;

  private:
    NavigationEngine navigation_engine_;
    EnergyModel energy_model_;
};

}  // namespace fleet_sim
