// === State Store =============================================================
//
// Durable per-vessel state keyed by vessel id. Readers receive immutable
// snapshots of the joined metadata+state rows; the scheduler is the only
// writer and replaces whole rows. Implementations must make reset_all
// all-or-nothing and bound every write by a timeout.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "fleet_sim/route.hpp"
#include "fleet_sim/types.hpp"
#include "fleet_sim/vessel.hpp"

namespace fleet_sim {

using FleetSnapshot = std::vector<VesselRecord>;
using FleetSnapshotPtr = std::shared_ptr<const FleetSnapshot>;

/** @brief Storage contract used by the scheduler and the fleet service. */
class StateStore {
  public:
    virtual ~StateStore() = default;

    /** @brief Consistent snapshot of every vessel, ordered by vessel id. */
    [[nodiscard]] virtual FleetSnapshotPtr get_all_with_states() const = 0;
    /** @brief Joined row for one vessel; throws NotFoundError when absent. */
    [[nodiscard]] virtual VesselRecord get_by_id(const std::string& vessel_id) const = 0;
    /** @brief Route of one vessel; throws NotFoundError when absent. */
    [[nodiscard]] virtual const Route& get_route(const std::string& vessel_id) const = 0;

    /**
     * @brief Replace the full state row of @c state.vessel_id.
     *
     * Throws PersistenceError (or StoreTimeoutError) when the row cannot be
     * committed; the previous row stays authoritative.
     */
    virtual void update_state(const VesselState& state) = 0;

    /**
     * @brief Restore every row to its initial snapshot, stamped @p reset_time.
     *
     * @return Number of rows reset. Either every row is restored or none is.
     */
    virtual std::size_t reset_all(Timestamp reset_time) = 0;
};

}  // namespace fleet_sim
