#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

namespace {
template <class... Visitors>
struct overloaded : Visitors... {
    using Visitors::operator()...;
};
}  // namespace

VesselStatus VesselState::status() const noexcept {
    return std::visit(
        overloaded{
            [](const ActiveMode&) { return VesselStatus::Active; },
            [](const ChargingMode&) { return VesselStatus::Charging; },
            [](const MaintenanceMode&) { return VesselStatus::Maintenance; },
        },
        mode
    );
}

double VesselState::speed_knots() const noexcept {
    if (const auto* active = std::get_if<ActiveMode>(&mode)) {
        return active->speed_knots;
    }
    return 0.0;
}

std::string_view to_string(VesselStatus status) noexcept {
    switch (status) {
        case VesselStatus::Active:
            return "Active";
        case VesselStatus::Charging:
            return "Charging";
        case VesselStatus::Maintenance:
            return "Maintenance";
    }
    return "Unknown";
}

bool equal_ignoring_timestamp(const VesselState& lhs, const VesselState& rhs) {
    VesselState rhs_aligned = rhs;
    rhs_aligned.last_updated = lhs.last_updated;
    return lhs == rhs_aligned;
}

}  // namespace fleet_sim
