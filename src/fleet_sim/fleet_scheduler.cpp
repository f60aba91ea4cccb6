#include "fleet_sim/fleet_scheduler.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "fleet_sim/errors.hpp"

namespace fleet_sim {

FleetScheduler::FleetScheduler(SchedulerConfig config, StateStore& state_store, FleetEventBus& event_bus)
    : FleetScheduler(config, state_store, event_bus, SimulationClock{}) {}

FleetScheduler::FleetScheduler(SchedulerConfig config,
                               StateStore& state_store,
                               FleetEventBus& event_bus,
                               SimulationClock clock)
    : config_(config),
      state_store_(state_store),
      event_bus_(event_bus),
      clock_(std::move(clock)),
      speed_multiplier_(config.speed_multiplier),
      logger_(get_logger()) {
    if (config_.tick_interval <= Duration::zero()) {
        throw std::invalid_argument("FleetScheduler tick interval must be positive");
    }
    if (config_.lock_timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("FleetScheduler lock timeout must be positive");
    }
    SimulationClock::validate_speed_multiplier(config_.speed_multiplier);
}

FleetScheduler::~FleetScheduler() {
    shutdown();
}

TickReport FleetScheduler::tick(double speed_multiplier) {
    SimulationClock::validate_speed_multiplier(speed_multiplier);
    const std::unique_lock<std::timed_mutex> tick_lock = lock_ticks("tick");
    return execute_tick(speed_multiplier);
}

TickReport FleetScheduler::tick() {
    return tick(speed_multiplier_.load());
}

std::size_t FleetScheduler::reset_all() {
    const std::unique_lock<std::timed_mutex> tick_lock = lock_ticks("reset_all");
    try {
        const std::size_t reset_count = state_store_.reset_all(clock_.now());
        clock_.reset();
        event_bus_.publish(FleetEvent{
            FleetEventKind::FleetReset,
            {},
            fmt::format("{} vessels restored to initial positions", reset_count),
            0
        });
        logger_->info("Fleet reset completed for {} vessels", reset_count);
        return reset_count;
    } catch (const std::exception& exc) {
        logger_->error("Fleet reset failed; previous state retained: {}", exc.what());
        throw;
    }
}

void FleetScheduler::set_speed_multiplier(double speed_multiplier) {
    SimulationClock::validate_speed_multiplier(speed_multiplier);
    const double previous = speed_multiplier_.exchange(speed_multiplier);
    if (previous != speed_multiplier) {
        logger_->info("Speed multiplier changed from {} to {}", previous, speed_multiplier);
    }
}

double FleetScheduler::speed_multiplier() const noexcept {
    return speed_multiplier_.load();
}

void FleetScheduler::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting fleet scheduler with {:.3f} s tick interval", config_.tick_interval.count());
    update_thread_ = std::thread(&FleetScheduler::update_loop, this);
}

void FleetScheduler::shutdown() {
    {
        std::scoped_lock lock(wake_mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    logger_->info("Shutting down fleet scheduler");
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
}

bool FleetScheduler::is_running() const noexcept {
    return flag_running_.load();
}

std::uint64_t FleetScheduler::ticks_completed() const noexcept {
    return ticks_completed_.load();
}

const SchedulerConfig& FleetScheduler::config() const noexcept {
    return config_;
}

/**
 * @brief Fixed-timestep loop that advances the fleet until shutdown.
 */
void FleetScheduler::update_loop() {
    const SteadyClock::duration steady_tick_interval = std::chrono::duration_cast<SteadyClock::duration>(config_.tick_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_tick) {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_until(lock, next_tick, [this]() { return !flag_running_.load(); });
            continue;
        }
        try {
            tick();
        } catch (const std::exception& exc) {
            logger_->error("Update loop error: {}", exc.what());
        }
        next_tick = now + steady_tick_interval;
    }
}

std::unique_lock<std::timed_mutex> FleetScheduler::lock_ticks(std::string_view operation) {
    std::unique_lock<std::timed_mutex> tick_lock(tick_mutex_, std::defer_lock);
    if (!tick_lock.try_lock_for(config_.lock_timeout)) {
        throw StoreTimeoutError(fmt::format(
            "Scheduler {} timed out after {} ms waiting for a running tick", operation, config_.lock_timeout.count()
        ));
    }
    return tick_lock;
}

TickReport FleetScheduler::execute_tick(double speed_multiplier) {
    const TickContext context = clock_.tick(speed_multiplier);
    TickReport report{};
    report.tick_number = context.tick_number;
    report.simulated_seconds = context.simulated_seconds;

    const FleetSnapshotPtr snapshot = state_store_.get_all_with_states();
    for (const VesselRecord& record : *snapshot) {
        const VesselState& current = record.state;
        const Route& route = state_store_.get_route(current.vessel_id);
        const VesselStep step = vessel_simulator_.step(current, route, context);
        if (!step.next_state.has_value()) {
            ++report.vessels_skipped;
            continue;
        }

        try {
            state_store_.update_state(step.next_state.value());
        } catch (const PersistenceError& exc) {
            ++report.persistence_failures;
            logger_->error(
                R"({{"component":"scheduler","tick":{},"vessel":"{}","action":"drop_update","error":"{}"}})",
                context.tick_number,
                current.vessel_id,
                exc.what()
            );
            event_bus_.publish(FleetEvent{FleetEventKind::PersistenceFailure, current.vessel_id, exc.what(), context.tick_number});
            continue;
        }
        ++report.vessels_updated;
        publish_step_events(step, current, context.tick_number);
    }

    ticks_completed_.fetch_add(1);
    logger_->debug(
        R"({{"component":"scheduler","tick":{},"multiplier":{},"simulated_s":{},"wall_elapsed_s":{:.3f},"updated":{},"skipped":{},"failed":{}}})",
        context.tick_number,
        context.speed_multiplier,
        context.simulated_seconds,
        context.wall_elapsed.count(),
        report.vessels_updated,
        report.vessels_skipped,
        report.persistence_failures
    );
    return report;
}

void FleetScheduler::publish_step_events(const VesselStep& step, const VesselState& previous, std::uint64_t tick_number) {
    const std::string& vessel_id = previous.vessel_id;
    if (step.navigation.waypoint_advanced) {
        logger_->info("Vessel {} reached waypoint {}; heading for waypoint {}",
                      vessel_id,
                      previous.current_waypoint_index,
                      step.navigation.waypoint_index);
        event_bus_.publish(FleetEvent{
            FleetEventKind::WaypointReached,
            vessel_id,
            fmt::format("waypoint {} -> {}", previous.current_waypoint_index, step.navigation.waypoint_index),
            tick_number
        });
    }

    const VesselState& next = step.next_state.value();
    switch (step.transition) {
        case ModeTransition::EnteredCharging:
            logger_->warn("Vessel {} at {:.1f}% energy; switching to solar charging", vessel_id, next.energy_level);
            event_bus_.publish(FleetEvent{
                FleetEventKind::ChargingStarted, vessel_id, fmt::format("energy {:.2f}%", next.energy_level), tick_number
            });
            break;
        case ModeTransition::ResumedActive:
            logger_->info("Vessel {} recharged to {:.1f}%; resuming at {} knots", vessel_id, next.energy_level, next.speed_knots());
            event_bus_.publish(FleetEvent{
                FleetEventKind::ChargingCompleted, vessel_id, fmt::format("energy {:.2f}%", next.energy_level), tick_number
            });
            break;
        case ModeTransition::None:
            break;
    }
}

}  // namespace fleet_sim
