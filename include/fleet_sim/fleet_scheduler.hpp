// === Fleet Scheduler =========================================================
//
// Single authoritative writer of vessel state. Owns the simulation clock,
// advances every vessel once per tick and commits the resulting rows to the
// state store. Ticks can be driven by the background update loop at a fixed
// interval or requested synchronously; either way a tick mutex serializes
// ticks and fleet resets, so callers never race on the clock anchor or on the
// vessel rows.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include "fleet_sim/fleet_event_bus.hpp"
#include "fleet_sim/logging.hpp"
#include "fleet_sim/simulation_clock.hpp"
#include "fleet_sim/state_store.hpp"
#include "fleet_sim/vessel_simulator.hpp"

namespace fleet_sim {

/**
 * @brief Tunable parameters for the scheduler.
 *
 * Populated at startup from the configuration loader and treated as
 * immutable while the simulation runs.
 */
struct SchedulerConfig final {
    Duration tick_interval{Duration{2.0}};              /**< Background loop cadence. */
    double speed_multiplier{1.0};                       /**< Initial multiplier for background ticks. */
    std::chrono::milliseconds lock_timeout{10'000};     /**< Upper bound on waiting for a running tick. */
};

/** @brief Summary of one executed tick. */
struct TickReport final {
    std::uint64_t tick_number{};
    double simulated_seconds{};
    std::size_t vessels_updated{};       /**< Rows committed to the store. */
    std::size_t vessels_skipped{};       /**< Maintenance or stationary vessels. */
    std::size_t persistence_failures{};  /**< Rows dropped for this tick. */
};

/** @brief Owns every mutation of vessel state. */
class FleetScheduler final {
  public:
    FleetScheduler(SchedulerConfig config, StateStore& state_store, FleetEventBus& event_bus);
    FleetScheduler(SchedulerConfig config, StateStore& state_store, FleetEventBus& event_bus, SimulationClock clock);
    ~FleetScheduler();

    FleetScheduler(const FleetScheduler&) = delete;
    FleetScheduler& operator=(const FleetScheduler&) = delete;

    /**
     * @brief Run one tick synchronously at @p speed_multiplier.
     *
     * Throws ValidationError before anything changes when the multiplier is
     * outside [0.1, 10]. Per-vessel persistence failures are reported, not
     * thrown.
     */
    TickReport tick(double speed_multiplier);
    /** @brief Run one tick at the current background multiplier. */
    TickReport tick();

    /**
     * @brief Stop-the-world reset of every vessel to its initial snapshot.
     *
     * Waits for any running tick, resets the store and the clock anchor, then
     * lets ticking resume. On failure nothing changes and the error propagates.
     */
    std::size_t reset_all();

    /** @brief Validate and set the multiplier used by background ticks. */
    void set_speed_multiplier(double speed_multiplier);
    [[nodiscard]] double speed_multiplier() const noexcept;

    /** @brief Start the background update loop. */
    void run();
    /** @brief Stop the background update loop and wait for it to exit. */
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept;

    [[nodiscard]] std::uint64_t ticks_completed() const noexcept;
    [[nodiscard]] const SchedulerConfig& config() const noexcept;

  private:
    /** @brief Fixed-interval loop driving background ticks. */
    void update_loop();
    [[nodiscard]] std::unique_lock<std::timed_mutex> lock_ticks(std::string_view operation);
    TickReport execute_tick(double speed_multiplier);
    void publish_step_events(const VesselStep& step, const VesselState& previous, std::uint64_t tick_number);

    SchedulerConfig config_;
    StateStore& state_store_;
    FleetEventBus& event_bus_;
    SimulationClock clock_;
    VesselSimulator vessel_simulator_;
    std::timed_mutex tick_mutex_;
    std::atomic<double> speed_multiplier_;
    std::atomic<std::uint64_t> ticks_completed_{0};
    std::atomic<bool> flag_running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread update_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace fleet_sim
