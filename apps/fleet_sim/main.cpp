#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "fleet_sim/configuration.hpp"
#include "fleet_sim/fleet_event_bus.hpp"
#include "fleet_sim/fleet_scheduler.hpp"
#include "fleet_sim/fleet_seed.hpp"
#include "fleet_sim/fleet_service.hpp"
#include "fleet_sim/in_memory_state_store.hpp"
#include "fleet_sim/logging.hpp"
#include "fleet_sim/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};
std::atomic<bool> reset_requested{false};

constexpr std::chrono::milliseconds k_poll_interval{100};

void handle_signal(int) {
    should_terminate.store(true);
}

void handle_reset_signal(int) {
    reset_requested.store(true);
}

void report_fleet(const fleet_sim::StateStore& state_store, fleet_sim::FleetEventBus& event_bus) {
    auto logger = fleet_sim::get_logger();
    for (const auto& event : event_bus.drain()) {
        logger->info(R"({{"event":"{}","vessel":"{}","tick":{},"detail":"{}"}})",
                     fleet_sim::to_string(event.kind),
                     event.vessel_id,
                     event.tick_number,
                     event.detail);
    }

    const auto snapshot = state_store.get_all_with_states();
    for (const auto& record : *snapshot) {
        const auto& state = record.state;
        logger->info(R"({{"vessel":"{}","status":"{}","lat":{:.5f},"lon":{:.5f},"energy":{:.1f},"waypoint":{},"speed":"{}"}})",
                     state.vessel_id,
                     fleet_sim::to_string(state.status()),
                     state.position.latitude_deg,
                     state.position.longitude_deg,
                     state.energy_level,
                     state.current_waypoint_index,
                     state.speed_description);
    }
}
}  // namespace

int main() {
    using namespace fleet_sim;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGUSR1, handle_reset_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();
        auto logger = get_logger();
        logger->info("Starting fleet_sim {}", k_version);

        InMemoryStateStore state_store{make_demo_fleet(), configuration.store};
        FleetEventBus event_bus{};
        FleetScheduler scheduler{configuration.scheduler, state_store, event_bus};
        FleetService service{state_store, scheduler, configuration.tick_policy};

        if (service.tick_policy() == TickPolicy::Scheduled) {
            scheduler.run();
        }

        const std::string listing_target = fmt::format("/boats?speed={}", configuration.scheduler.speed_multiplier);
        const auto tick_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration.scheduler.tick_interval);
        const auto report_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration.report_interval);
        auto next_request = SteadyClock::now() + tick_interval;
        auto next_report = SteadyClock::now() + report_interval;

        while (!should_terminate.load()) {
            if (reset_requested.exchange(false)) {
                const ApiResponse response = service.handle("POST", "/boats/reset");
                logger->info("Reset requested by signal: status={} body={}", response.status_code, response.body);
            }

            const auto now = SteadyClock::now();
            if (service.tick_policy() == TickPolicy::OnRequest && now >= next_request) {
                const ApiResponse response = service.handle("GET", listing_target);
                if (response.status_code != 200) {
                    logger->warn("Fleet listing failed: status={} body={}", response.status_code, response.body);
                }
                next_request = now + tick_interval;
            }
            if (now >= next_report) {
                report_fleet(state_store, event_bus);
                next_report = now + report_interval;
            }

            std::this_thread::sleep_for(k_poll_interval);
        }

        scheduler.shutdown();
        logger->info("fleet_sim stopped after {} ticks", scheduler.ticks_completed());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
