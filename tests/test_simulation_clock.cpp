#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "fleet_sim/errors.hpp"
#include "fleet_sim/simulation_clock.hpp"

using namespace fleet_sim;

namespace {

struct ManualTime final {
    Timestamp current{SystemClock::now()};

    void advance(Duration step) {
        current += std::chrono::duration_cast<SystemClock::duration>(step);
    }
};

SimulationClock make_manual_clock(const std::shared_ptr<ManualTime>& manual_time) {
    return SimulationClock{[manual_time]() { return manual_time->current; }};
}

}  // namespace

TEST_CASE("Speed multiplier bounds are inclusive") {
    REQUIRE_NOTHROW(SimulationClock::validate_speed_multiplier(0.1));
    REQUIRE_NOTHROW(SimulationClock::validate_speed_multiplier(1.0));
    REQUIRE_NOTHROW(SimulationClock::validate_speed_multiplier(10.0));
    REQUIRE_THROWS_AS(SimulationClock::validate_speed_multiplier(0.05), ValidationError);
    REQUIRE_THROWS_AS(SimulationClock::validate_speed_multiplier(10.5), ValidationError);
    REQUIRE_THROWS_AS(SimulationClock::validate_speed_multiplier(-1.0), ValidationError);
    REQUIRE_THROWS_AS(SimulationClock::validate_speed_multiplier(std::numeric_limits<double>::quiet_NaN()), ValidationError);
    REQUIRE_THROWS_AS(SimulationClock::validate_speed_multiplier(std::numeric_limits<double>::infinity()), ValidationError);
}

TEST_CASE("Each tick budgets one simulated second scaled by the multiplier") {
    auto manual_time = std::make_shared<ManualTime>();
    SimulationClock clock = make_manual_clock(manual_time);

    const TickContext first = clock.tick(1.0);
    const TickContext second = clock.tick(2.5);

    REQUIRE(first.tick_number == 1);
    REQUIRE(second.tick_number == 2);
    REQUIRE(first.simulated_seconds == Approx(1.0));
    REQUIRE(second.simulated_seconds == Approx(2.5));
    REQUIRE(second.speed_multiplier == Approx(2.5));
    REQUIRE(clock.ticks_issued() == 2);
}

TEST_CASE("Wall time between ticks does not change the simulated budget") {
    auto manual_time = std::make_shared<ManualTime>();
    SimulationClock clock = make_manual_clock(manual_time);

    manual_time->advance(Duration{30.0});
    const TickContext context = clock.tick(1.0);

    REQUIRE(context.simulated_seconds == Approx(1.0));
    REQUIRE(context.wall_elapsed.count() == Approx(30.0));
    REQUIRE(context.timestamp == manual_time->current);
    REQUIRE(clock.last_update() == manual_time->current);
}

TEST_CASE("Invalid multipliers leave the clock untouched") {
    auto manual_time = std::make_shared<ManualTime>();
    SimulationClock clock = make_manual_clock(manual_time);
    const Timestamp anchor = clock.last_update();

    manual_time->advance(Duration{5.0});
    REQUIRE_THROWS_AS(clock.tick(0.0), ValidationError);
    REQUIRE(clock.ticks_issued() == 0);
    REQUIRE(clock.last_update() == anchor);
}

TEST_CASE("Reset moves the anchor to now") {
    auto manual_time = std::make_shared<ManualTime>();
    SimulationClock clock = make_manual_clock(manual_time);

    manual_time->advance(Duration{120.0});
    clock.reset();
    manual_time->advance(Duration{2.0});
    const TickContext context = clock.tick(1.0);

    REQUIRE(context.wall_elapsed.count() == Approx(2.0));
}

TEST_CASE("SimulationClock requires a time source") {
    REQUIRE_THROWS_AS(SimulationClock{SimulationClock::NowFunction{}}, std::invalid_argument);
}
