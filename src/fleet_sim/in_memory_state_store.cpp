#include "fleet_sim/in_memory_state_store.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "fleet_sim/errors.hpp"

namespace fleet_sim {

namespace {

bool is_finite_non_negative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

}  // namespace

std::string describe_invalid_row(const VesselState& state, const Route& route) {
    if (!is_valid_coordinate(state.position)) {
        return fmt::format("position ({}, {}) out of range", state.position.latitude_deg, state.position.longitude_deg);
    }
    if (!(state.heading_deg >= 0.0 && state.heading_deg < 360.0)) {
        return fmt::format("heading {} outside [0, 360)", state.heading_deg);
    }
    if (!is_finite_non_negative(state.speed_knots())) {
        return fmt::format("speed {} is negative", state.speed_knots());
    }
    if (!is_finite_non_negative(state.original_speed_knots)) {
        return fmt::format("original speed {} is negative", state.original_speed_knots);
    }
    if (!(state.energy_level >= 0.0 && state.energy_level <= 100.0)) {
        return fmt::format("energy level {} outside [0, 100]", state.energy_level);
    }
    if (!is_finite_non_negative(state.area_covered)) {
        return fmt::format("area covered {} is negative", state.area_covered);
    }
    if (state.current_waypoint_index >= route.size()) {
        return fmt::format("waypoint index {} outside route of {} waypoints", state.current_waypoint_index, route.size());
    }
    return {};
}

InMemoryStateStore::InMemoryStateStore(FleetSeed seed, StoreOptions options)
    : options_(options),
      route_table_(std::move(seed.routes)),
      logger_(get_logger()) {
    if (options_.operation_timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("InMemoryStateStore timeout must be positive");
    }
    if (seed.vessels.size() != seed.states.size()) {
        throw std::invalid_argument(fmt::format(
            "Seed has {} vessels but {} state rows", seed.vessels.size(), seed.states.size()
        ));
    }

    std::map<std::string, Vessel> map_vessels{};
    for (Vessel& vessel : seed.vessels) {
        if (vessel.id.empty()) {
            throw std::invalid_argument("Seed vessel id cannot be empty");
        }
        if (vessel.crew_count <= 0) {
            throw std::invalid_argument(fmt::format("Vessel {} must have a positive crew count", vessel.id));
        }
        const std::string vessel_id = vessel.id;
        if (!map_vessels.emplace(vessel_id, std::move(vessel)).second) {
            throw std::invalid_argument(fmt::format("Duplicate vessel id {}", vessel_id));
        }
    }

    auto initial_snapshot = std::make_shared<FleetSnapshot>();
    initial_snapshot->reserve(map_vessels.size());
    std::sort(seed.states.begin(), seed.states.end(), [](const VesselState& lhs, const VesselState& rhs) {
        return lhs.vessel_id < rhs.vessel_id;
    });
    for (VesselState& state : seed.states) {
        const auto it_vessel = map_vessels.find(state.vessel_id);
        if (it_vessel == map_vessels.end()) {
            throw std::invalid_argument(fmt::format("State row for unknown vessel {}", state.vessel_id));
        }
        if (map_row_index_.contains(state.vessel_id)) {
            throw std::invalid_argument(fmt::format("Duplicate state row for vessel {}", state.vessel_id));
        }
        if (!route_table_.contains(state.vessel_id)) {
            throw std::invalid_argument(fmt::format("Vessel {} has no route", state.vessel_id));
        }
        const std::string reason = describe_invalid_row(state, route_table_.route_for(state.vessel_id));
        if (!reason.empty()) {
            throw std::invalid_argument(fmt::format("Invalid seed state for {}: {}", state.vessel_id, reason));
        }

        map_row_index_.emplace(state.vessel_id, initial_snapshot->size());
        list_initial_states_.push_back(state);
        initial_snapshot->push_back(VesselRecord{it_vessel->second, std::move(state)});
    }
    if (route_table_.size() != initial_snapshot->size()) {
        throw std::invalid_argument("Seed contains routes for vessels without state rows");
    }

    snapshot_ = std::move(initial_snapshot);
    logger_->info("State store seeded with {} vessels", snapshot_->size());
}

FleetSnapshotPtr InMemoryStateStore::get_all_with_states() const {
    return load_snapshot();
}

VesselRecord InMemoryStateStore::get_by_id(const std::string& vessel_id) const {
    const auto it = map_row_index_.find(vessel_id);
    if (it == map_row_index_.end()) {
        logger_->warn("Vessel {} not found", vessel_id);
        throw NotFoundError(fmt::format("Vessel {} not found", vessel_id));
    }
    const FleetSnapshotPtr snapshot = load_snapshot();
    return snapshot->at(it->second);
}

const Route& InMemoryStateStore::get_route(const std::string& vessel_id) const {
    return route_table_.route_for(vessel_id);
}

void InMemoryStateStore::update_state(const VesselState& state) {
    const std::size_t index = row_index(state.vessel_id);
    const std::string reason = describe_invalid_row(state, route_table_.route_for(state.vessel_id));
    if (!reason.empty()) {
        throw PersistenceError(fmt::format("Rejected state row for {}: {}", state.vessel_id, reason));
    }

    const std::unique_lock<std::timed_mutex> write_lock = lock_for_write("update_state");
    const FleetSnapshotPtr current = load_snapshot();
    const VesselState& previous = (*current)[index].state;
    if (state.area_covered < previous.area_covered) {
        throw PersistenceError(fmt::format(
            "Rejected state row for {}: area covered would decrease from {} to {}",
            state.vessel_id,
            previous.area_covered,
            state.area_covered
        ));
    }

    auto next = std::make_shared<FleetSnapshot>(*current);
    (*next)[index].state = state;
    publish_snapshot(std::move(next));
    committed_writes_.fetch_add(1, std::memory_order_relaxed);
    logger_->debug("Updated state row for {}", state.vessel_id);
}

std::size_t InMemoryStateStore::reset_all(Timestamp reset_time) {
    const std::unique_lock<std::timed_mutex> write_lock = lock_for_write("reset_all");
    const FleetSnapshotPtr current = load_snapshot();

    auto next = std::make_shared<FleetSnapshot>(*current);
    for (std::size_t index = 0; index < next->size(); ++index) {
        VesselState restored = list_initial_states_[index];
        restored.current_waypoint_index = 0;
        restored.last_updated = reset_time;
        (*next)[index].state = std::move(restored);
    }

    const std::size_t reset_count = next->size();
    publish_snapshot(std::move(next));
    committed_writes_.fetch_add(1, std::memory_order_relaxed);
    logger_->info("Reset {} vessels to initial state", reset_count);
    return reset_count;
}

const VesselState& InMemoryStateStore::initial_snapshot(const std::string& vessel_id) const {
    const auto it = map_row_index_.find(vessel_id);
    if (it == map_row_index_.end()) {
        throw NotFoundError(fmt::format("Vessel {} not found", vessel_id));
    }
    return list_initial_states_[it->second];
}

std::size_t InMemoryStateStore::size() const noexcept {
    return list_initial_states_.size();
}

std::uint64_t InMemoryStateStore::committed_writes() const noexcept {
    return committed_writes_.load(std::memory_order_relaxed);
}

std::unique_lock<std::timed_mutex> InMemoryStateStore::suspend_writes() {
    std::unique_lock<std::timed_mutex> write_lock = lock_for_write("suspend_writes");
    logger_->info("Writes suspended");
    return write_lock;
}

std::unique_lock<std::timed_mutex> InMemoryStateStore::lock_for_write(std::string_view operation) {
    std::unique_lock<std::timed_mutex> write_lock(write_mutex_, std::defer_lock);
    if (!write_lock.try_lock_for(options_.operation_timeout)) {
        logger_->error(
            R"({{"component":"state_store","operation":"{}","error":"timeout","timeout_ms":{}}})",
            operation,
            options_.operation_timeout.count()
        );
        throw StoreTimeoutError(fmt::format(
            "State store {} timed out after {} ms", operation, options_.operation_timeout.count()
        ));
    }
    return write_lock;
}

std::size_t InMemoryStateStore::row_index(const std::string& vessel_id) const {
    const auto it = map_row_index_.find(vessel_id);
    if (it == map_row_index_.end()) {
        throw PersistenceError(fmt::format("No state row for vessel {}", vessel_id));
    }
    return it->second;
}

FleetSnapshotPtr InMemoryStateStore::load_snapshot() const {
    std::scoped_lock lock(snapshot_mutex_);
    return snapshot_;
}

void InMemoryStateStore::publish_snapshot(FleetSnapshotPtr snapshot) {
    std::scoped_lock lock(snapshot_mutex_);
    snapshot_ = std::move(snapshot);
}

}  // namespace fleet_sim
