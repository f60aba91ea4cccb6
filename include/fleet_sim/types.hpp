// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// fleet simulator (time primitives, geodetic coordinates).

#pragma once

#include <chrono>

namespace fleet_sim {

/**
 * @brief Alias for the steady clock used to pace the update loop.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for the wall clock used to stamp persisted rows.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps stored with each vessel state.
 */
using Timestamp = std::chrono::time_point<SystemClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    bool operator==(const GeodeticCoordinate&) const = default;
};

}  // namespace fleet_sim
