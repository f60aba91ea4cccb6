// === Geodesy =================================================================
//
// Great-circle helpers shared by navigation and energy logic. All functions
// are pure and deterministic; coordinates are not validated here.

#pragma once

#include <numbers>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

inline constexpr double k_earth_radius_km{6'371.0};        /**< Mean Earth radius used for haversine distances. */
inline constexpr double k_km_to_nautical_miles{0.539957};  /**< Kilometres to nautical miles. */

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/**
 * @brief Convert radians to degrees.
 */
constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

/**
 * @brief Haversine great-circle distance between two coordinates.
 *
 * @return Distance in nautical miles.
 */
[[nodiscard]] double distance_nm(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Initial great-circle bearing from one coordinate toward another.
 *
 * @return Forward azimuth in degrees, normalized into [0, 360); 0 is North.
 */
[[nodiscard]] double bearing_deg(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

}  // namespace fleet_sim
