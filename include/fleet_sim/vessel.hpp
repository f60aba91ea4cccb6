// === Vessel Model ============================================================
//
// Immutable vessel metadata plus the mutable per-vessel state row advanced by
// the simulation. The operating mode is a closed variant so that per-mode
// data (the cruising speed of an Active vessel) cannot leak into modes where
// it has no meaning.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/**
 * @brief Static vessel metadata; created at seed time and never mutated.
 */
struct Vessel final {
    std::string id{};           /**< Unique, stable vessel identifier (e.g. BOAT-001). */
    std::string vessel_name{};  /**< Display name. */
    int crew_count{};           /**< Crew on board; always positive. */
    std::string equipment{};    /**< Installed survey equipment. */
    std::string project{};      /**< Current project assignment. */
    std::string survey_type{};  /**< Survey operation type. */

    bool operator==(const Vessel&) const = default;
};

/**
 * @brief Flat status tag used for reporting and persistence.
 */
enum class VesselStatus {
    Active,       /**< Under way toward the current waypoint. */
    Charging,     /**< Station keeping while the battery recharges. */
    Maintenance   /**< Out of service; skipped by the tick process. */
};

/** @brief Under way at @p speed_knots. */
struct ActiveMode final {
    double speed_knots{};

    bool operator==(const ActiveMode&) const = default;
};

/** @brief Station keeping at zero speed until the battery recovers. */
struct ChargingMode final {
    bool operator==(const ChargingMode&) const = default;
};

/** @brief Out of service; left untouched until a fleet reset. */
struct MaintenanceMode final {
    bool operator==(const MaintenanceMode&) const = default;
};

using OperatingMode = std::variant<ActiveMode, ChargingMode, MaintenanceMode>;

/**
 * @brief Mutable state row of one vessel, replaced wholesale on every write.
 */
struct VesselState final {
    std::string vessel_id{};                 /**< Owning vessel. */
    GeodeticCoordinate position{};           /**< Current position. */
    double heading_deg{};                    /**< Heading in [0, 360), 0 is North. */
    OperatingMode mode{ActiveMode{}};        /**< Operating mode with per-mode data. */
    double original_speed_knots{};           /**< Cruising speed resumed after charging. */
    double energy_level{};                   /**< Battery percentage in [0, 100]. */
    std::string speed_description{};        /**< Human-readable speed, e.g. "12 knots". */
    std::string conditions{};                /**< Human-readable sea/operating conditions. */
    double area_covered{};                   /**< Cumulative surveyed area; never decreases. */
    std::size_t current_waypoint_index{};    /**< Index of the target waypoint in the route. */
    Timestamp last_updated{};                /**< Time of the most recent write. */

    [[nodiscard]] VesselStatus status() const noexcept;
    /** @brief Current speed; zero outside ActiveMode. */
    [[nodiscard]] double speed_knots() const noexcept;

    bool operator==(const VesselState&) const = default;
};

/**
 * @brief Joined metadata and state, as served to readers.
 */
struct VesselRecord final {
    Vessel vessel{};
    VesselState state{};
};

[[nodiscard]] std::string_view to_string(VesselStatus status) noexcept;

/**
 * @brief Compare two state rows on every field except @c last_updated.
 */
[[nodiscard]] bool equal_ignoring_timestamp(const VesselState& lhs, const VesselState& rhs);

}  // namespace fleet_sim
