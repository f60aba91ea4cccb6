#include "fleet_sim/simulation_clock.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "fleet_sim/errors.hpp"

namespace fleet_sim {

SimulationClock::SimulationClock()
    : SimulationClock([]() { return SystemClock::now(); }) {}

SimulationClock::SimulationClock(NowFunction now_function)
    : now_function_(std::move(now_function)) {
    if (!now_function_) {
        throw std::invalid_argument("SimulationClock requires a time source");
    }
    last_update_ = now_function_();
}

void SimulationClock::validate_speed_multiplier(double speed_multiplier) {
    if (std::isnan(speed_multiplier)
        || speed_multiplier < k_min_speed_multiplier
        || speed_multiplier > k_max_speed_multiplier) {
        throw ValidationError(fmt::format(
            "Speed multiplier {} outside [{}, {}]", speed_multiplier, k_min_speed_multiplier, k_max_speed_multiplier
        ));
    }
}

TickContext SimulationClock::tick(double speed_multiplier) {
    validate_speed_multiplier(speed_multiplier);

    const Timestamp current_time = now_function_();
    TickContext context{};
    context.tick_number = ++tick_count_;
    context.speed_multiplier = speed_multiplier;
    context.simulated_seconds = k_simulated_seconds_per_tick * speed_multiplier;
    context.wall_elapsed = std::chrono::duration_cast<Duration>(current_time - last_update_);
    context.timestamp = current_time;
    last_update_ = current_time;
    return context;
}

void SimulationClock::reset() {
    last_update_ = now_function_();
}

Timestamp SimulationClock::last_update() const noexcept {
    return last_update_;
}

std::uint64_t SimulationClock::ticks_issued() const noexcept {
    return tick_count_;
}

Timestamp SimulationClock::now() const {
    return now_function_();
}

}  // namespace fleet_sim
