#include "fleet_sim/fleet_event_bus.hpp"

#include <iterator>
#include <stdexcept>

namespace fleet_sim {

FleetEventBus::FleetEventBus(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("FleetEventBus capacity must be positive");
    }
}

void FleetEventBus::publish(FleetEvent event) {
    std::scoped_lock lock(mutex_);
    if (queue_events_.size() >= capacity_) {
        queue_events_.pop_front();
        ++dropped_count_;
    }
    queue_events_.push_back(std::move(event));
}

std::optional<FleetEvent> FleetEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    FleetEvent event = std::move(queue_events_.front());
    queue_events_.pop_front();
    return event;
}

std::vector<FleetEvent> FleetEventBus::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<FleetEvent> list_events(std::make_move_iterator(queue_events_.begin()),
                                        std::make_move_iterator(queue_events_.end()));
    queue_events_.clear();
    return list_events;
}

std::size_t FleetEventBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::uint64_t FleetEventBus::dropped() const {
    std::scoped_lock lock(mutex_);
    return dropped_count_;
}

std::string_view to_string(FleetEventKind kind) noexcept {
    switch (kind) {
        case FleetEventKind::WaypointReached:
            return "waypoint_reached";
        case FleetEventKind::ChargingStarted:
            return "charging_started";
        case FleetEventKind::ChargingCompleted:
            return "charging_completed";
        case FleetEventKind::PersistenceFailure:
            return "persistence_failure";
        case FleetEventKind::FleetReset:
            return "fleet_reset";
    }
    return "unknown";
}

}  // namespace fleet_sim
