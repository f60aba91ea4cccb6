// === Simulation Clock ========================================================
//
// Owns the single "last update" anchor of the simulation and converts a
// caller-supplied speed multiplier into the simulated seconds of one tick.
// Simulated time is a fixed 1 s per tick scaled by the multiplier; the real
// time elapsed between ticks is measured for diagnostics only, so the
// distance a vessel covers depends on tick frequency rather than wall time.

#pragma once

#include <cstdint>
#include <functional>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/**
 * @brief Everything the per-vessel rules need to know about one tick.
 */
struct TickContext final {
    std::uint64_t tick_number{};  /**< Monotonic tick counter, starting at 1. */
    double speed_multiplier{};    /**< Validated multiplier in [0.1, 10]. */
    double simulated_seconds{};   /**< Simulated time budget for the tick. */
    Duration wall_elapsed{};      /**< Real time since the previous anchor. */
    Timestamp timestamp{};        /**< Stamp applied to rows written by the tick. */
};

/** @brief Scheduler-owned time anchor; not thread-safe on its own. */
class SimulationClock final {
  public:
    using NowFunction = std::function<Timestamp()>;

    static constexpr double k_min_speed_multiplier{0.1};
    static constexpr double k_max_speed_multiplier{10.0};
    static constexpr double k_simulated_seconds_per_tick{1.0};

    SimulationClock();
    explicit SimulationClock(NowFunction now_function);

    /** @brief Throw ValidationError unless @p speed_multiplier lies in [0.1, 10]. */
    static void validate_speed_multiplier(double speed_multiplier);

    /** @brief Validate the multiplier, move the anchor to now and describe the tick. */
    TickContext tick(double speed_multiplier);
    /** @brief Move the anchor to now so the next tick sees no time jump. */
    void reset();

    [[nodiscard]] Timestamp last_update() const noexcept;
    [[nodiscard]] std::uint64_t ticks_issued() const noexcept;
    [[nodiscard]] Timestamp now() const;

  private:
    NowFunction now_function_;
    Timestamp last_update_;
    std::uint64_t tick_count_{0};
};

}  // namespace fleet_sim
