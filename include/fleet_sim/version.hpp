// === Version Metadata ========================================================
//
// Exposes the simulator's semantic version string used in logs and health
// responses.

#pragma once

#include <string_view>

namespace fleet_sim {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace fleet_sim
