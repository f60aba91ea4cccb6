// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe scheduler,
// state-store, service and logging settings consumed across the simulator.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "fleet_sim/fleet_scheduler.hpp"
#include "fleet_sim/fleet_service.hpp"
#include "fleet_sim/in_memory_state_store.hpp"
#include "fleet_sim/types.hpp"

namespace fleet_sim {

/**
 * @brief Immutable bundle of runtime knobs for the fleet simulation.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                      /**< Destination directory for structured logs. */
    std::string log_level{};                          /**< spdlog level name. */
    SchedulerConfig scheduler{};                      /**< Tick cadence and initial multiplier. */
    StoreOptions store{};                             /**< State-store timeouts. */
    TickPolicy tick_policy{TickPolicy::Scheduled};    /**< How listings relate to ticks. */
    Duration report_interval{Duration{5.0}};          /**< Cadence of fleet status reports. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static double load_speed_multiplier();
    static TickPolicy load_tick_policy();
};

}  // namespace fleet_sim
