// === In-Memory State Store ===================================================
//
// Copy-on-write implementation of StateStore. Each committed write builds a
// new immutable snapshot and publishes it by swapping a shared pointer, so
// readers only ever hold complete snapshots and never wait on a writer.
// Writers are serialized by a timed mutex; failing to acquire it within the
// configured timeout surfaces as StoreTimeoutError. Rows are checked against
// the persisted-shape constraints before they are committed.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "fleet_sim/fleet_seed.hpp"
#include "fleet_sim/logging.hpp"
#include "fleet_sim/state_store.hpp"

namespace fleet_sim {

/** @brief Tunables for the in-memory store. */
struct StoreOptions final {
    std::chrono::milliseconds operation_timeout{5'000}; /**< Upper bound on waiting for the write lock. */
};

class InMemoryStateStore final : public StateStore {
  public:
    /**
     * @brief Build the store from a seed and capture the initial snapshot.
     *
     * Throws std::invalid_argument unless every vessel has exactly one state
     * row and one route, ids are unique, and every row is valid.
     */
    InMemoryStateStore(FleetSeed seed, StoreOptions options);

    [[nodiscard]] FleetSnapshotPtr get_all_with_states() const override;
    [[nodiscard]] VesselRecord get_by_id(const std::string& vessel_id) const override;
    [[nodiscard]] const Route& get_route(const std::string& vessel_id) const override;
    void update_state(const VesselState& state) override;
    std::size_t reset_all(Timestamp reset_time) override;

    /** @brief Row captured at construction; throws NotFoundError when absent. */
    [[nodiscard]] const VesselState& initial_snapshot(const std::string& vessel_id) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::uint64_t committed_writes() const noexcept;

    /**
     * @brief Hold off every writer until the returned lock is released.
     *
     * Used to read a stable fleet while exporting it. Writers that wait past
     * the store timeout fail with StoreTimeoutError. Throws StoreTimeoutError
     * itself when a writer does not finish within the timeout.
     */
    [[nodiscard]] std::unique_lock<std::timed_mutex> suspend_writes();

  private:
    [[nodiscard]] std::unique_lock<std::timed_mutex> lock_for_write(std::string_view operation);
    [[nodiscard]] std::size_t row_index(const std::string& vessel_id) const;
    [[nodiscard]] FleetSnapshotPtr load_snapshot() const;
    void publish_snapshot(FleetSnapshotPtr snapshot);

    StoreOptions options_;
    RouteTable route_table_;
    std::vector<VesselState> list_initial_states_;
    std::map<std::string, std::size_t> map_row_index_;
    std::timed_mutex write_mutex_;
    mutable std::mutex snapshot_mutex_;
    FleetSnapshotPtr snapshot_;
    std::atomic<std::uint64_t> committed_writes_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Describe why a state row violates the persisted-shape constraints.
 *
 * @return Empty string when the row is valid for @p route.
 */
[[nodiscard]] std::string describe_invalid_row(const VesselState& state, const Route& route);

}  // namespace fleet_sim
