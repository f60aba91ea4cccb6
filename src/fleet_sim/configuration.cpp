// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the fleet simulation. This implementation provides a narrow interface
// (`ConfigurationLoader`) that transforms raw environment variables into the
// strongly-typed `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults and sane bounds for knobs such as tick interval, speed
//   multiplier and store timeout.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: This file never reads from disk; callers are expected to populate the
// process environment ahead of time (e.g. a shell-sourced `.env`).

#include "fleet_sim/configuration.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "fleet_sim/errors.hpp"
#include "fleet_sim/logging.hpp"
#include "fleet_sim/simulation_clock.hpp"

namespace fleet_sim {

namespace {
constexpr double k_default_tick_interval_s{2.0};
constexpr double k_default_speed_multiplier{1.0};
constexpr int k_default_store_timeout_ms{5'000};
constexpr double k_default_report_interval_s{5.0};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* environment_name, std::string_view fallback) {
    const char* raw_value = std::getenv(environment_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("FLEET_SIM_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string("FLEET_SIM_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.log_directory);
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    config.scheduler.tick_interval = Duration{parse_double(std::getenv("FLEET_SIM_TICK_INTERVAL_S"), k_default_tick_interval_s)};
    config.scheduler.speed_multiplier = load_speed_multiplier();
    config.store.operation_timeout = std::chrono::milliseconds{
        parse_int(std::getenv("FLEET_SIM_STORE_TIMEOUT_MS"), k_default_store_timeout_ms)
    };
    config.scheduler.lock_timeout = config.store.operation_timeout * 2;
    config.tick_policy = load_tick_policy();
    config.report_interval = Duration{parse_double(std::getenv("FLEET_SIM_REPORT_INTERVAL_S"), k_default_report_interval_s)};

    logger->info("Configuration loaded: tick_policy={} tick_interval_s={} speed_multiplier={} store_timeout_ms={}",
                 to_string(config.tick_policy),
                 config.scheduler.tick_interval.count(),
                 config.scheduler.speed_multiplier,
                 config.store.operation_timeout.count());

    return config;
}

double ConfigurationLoader::load_speed_multiplier() {
    const double parsed_value = parse_double(std::getenv("FLEET_SIM_SPEED_MULTIPLIER"), k_default_speed_multiplier);
    try {
        SimulationClock::validate_speed_multiplier(parsed_value);
    } catch (const ValidationError& exc) {
        auto logger = get_logger();
        logger->warn("{}; using fallback {}", exc.what(), k_default_speed_multiplier);
        return k_default_speed_multiplier;
    }
    return parsed_value;
}

TickPolicy ConfigurationLoader::load_tick_policy() {
    const std::string raw_policy = parse_string("FLEET_SIM_TICK_POLICY", "scheduled");
    if (raw_policy == "scheduled") {
        return TickPolicy::Scheduled;
    }
    if (raw_policy == "on_request") {
        return TickPolicy::OnRequest;
    }
    auto logger = get_logger();
    logger->warn("Unknown tick policy {}; defaulting to scheduled", raw_policy);
    return TickPolicy::Scheduled;
}

}  // namespace fleet_sim
