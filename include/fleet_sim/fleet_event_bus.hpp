// === Fleet Event Bus =========================================================
//
// Provides a bounded thread-safe queue for distributing notable tick outcomes
// (mode transitions, waypoint arrivals, dropped writes, resets) from the
// scheduler to the operator-facing consumers.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_sim {

/** @brief Category of a fleet event. */
enum class FleetEventKind {
    WaypointReached,     /**< Arrival test fired and the route index advanced. */
    ChargingStarted,     /**< Active vessel dropped below the low-energy threshold. */
    ChargingCompleted,   /**< Charging vessel resumed its cruising speed. */
    PersistenceFailure,  /**< A tick write was dropped; the previous row remains. */
    FleetReset           /**< Every vessel was restored to its initial snapshot. */
};

/** @brief Wrapper representing a single event publication. */
struct FleetEvent final {
    FleetEventKind kind{FleetEventKind::WaypointReached};
    std::string vessel_id{};    /**< Affected vessel; empty for fleet-wide events. */
    std::string detail{};       /**< Free-form description for operators. */
    std::uint64_t tick_number{}; /**< Tick that produced the event; 0 outside ticks. */
};

/** @brief Thread-safe FIFO used to exchange fleet events; drops the oldest entry when full. */
class FleetEventBus final {
  public:
    static constexpr std::size_t k_default_capacity{1'024};

    explicit FleetEventBus(std::size_t capacity = k_default_capacity);

    /** @brief Publish an event to all consumers. */
    void publish(FleetEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<FleetEvent> try_consume();
    /** @brief Consume every pending event in publication order. */
    [[nodiscard]] std::vector<FleetEvent> drain();
    [[nodiscard]] std::size_t pending() const;
    /** @brief Events discarded because the queue was full. */
    [[nodiscard]] std::uint64_t dropped() const;

  private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<FleetEvent> queue_events_;
    std::uint64_t dropped_count_{0};
};

[[nodiscard]] std::string_view to_string(FleetEventKind kind) noexcept;

}  // namespace fleet_sim
